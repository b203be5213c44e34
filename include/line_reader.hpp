#pragma once
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <zlib.h>

namespace routemap {

// Buffered line reader over plain or gzip-compressed text.
// gzopen() reads uncompressed input transparently, so one handle covers both.
class LineReader {
public:
    explicit LineReader(const std::string& path, int bufsize = 1 << 16)
        : path_(path), buf_(static_cast<size_t>(bufsize))
    {
        gzFile fp = gzopen(path.c_str(), "rb");
        if (!fp) {
            throw std::runtime_error("LineReader: cannot open file: " + path);
        }
        fp_.reset(fp);
    }

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    const std::string& path() const { return path_; }
    uint64_t line_number() const    { return line_no_; }

    // Read next line without the trailing "\n" / "\r\n"; return false at EOF
    bool getline(std::string& out) {
        out.clear();
        bool got_any = false;
        for (;;) {
            if (beg_ >= end_) {
                if (eof_) break;
                refill_();
                if (end_ == 0) break;
            }

            const char* base = buf_.data();
            const char* p = static_cast<const char*>(std::memchr(base + beg_, '\n', static_cast<size_t>(end_ - beg_)));
            if (p) {
                const int i = static_cast<int>(p - base);
                out.append(base + beg_, static_cast<size_t>(i - beg_));
                beg_ = i + 1;
                got_any = true;
                break;
            }
            out.append(base + beg_, static_cast<size_t>(end_ - beg_));
            beg_ = end_;
            got_any = true;
        }

        if (!got_any) return false;
        if (!out.empty() && out.back() == '\r') out.pop_back();
        ++line_no_;
        return true;
    }

private:
    void refill_() {
        beg_ = 0;
        end_ = gzread(fp_.get(), buf_.data(), static_cast<unsigned>(buf_.size()));
        if (end_ < 0) {
            int errnum = 0;
            const char* msg = gzerror(fp_.get(), &errnum);
            throw std::runtime_error("LineReader: read error in " + path_ + ": " + (msg ? msg : "unknown"));
        }
        if (end_ == 0) eof_ = true;
    }

    std::string path_;
    std::unique_ptr<gzFile_s, int(*)(gzFile)> fp_{nullptr, gzclose};
    std::vector<char> buf_;
    int beg_ = 0;
    int end_ = 0;
    bool eof_ = false;
    uint64_t line_no_ = 0;
};

} // namespace routemap
