#include "../include/route_writer.hpp"
#include "../include/logger.hpp"

#include <iostream>
#include <stdexcept>

namespace routemap {

static bool ends_with_gz_(const std::string& s) {
    if (s.size() < 3) return false;
    const std::string suf = s.substr(s.size() - 3);
    return suf == ".gz" || suf == ".GZ";
}

/*------------------------------------------------------------*/
/*                       constructor                         */
/*------------------------------------------------------------*/
RouteWriter::RouteWriter(const std::string& outFileName, size_t cacheSize)
    : outputFileName_(outFileName), cache_size_(cacheSize) {
    is_gzip_ = ends_with_gz_(outputFileName_);

    if (is_gzip_) {
        gzFile fp = gzopen(outputFileName_.c_str(), "wb");
        if (!fp) throw std::runtime_error(outputFileName_ + ": cannot open for writing");
        gzfpO_.reset(fp);
    } else if (!outputFileName_.empty()) {
        fpO_.open(outputFileName_, std::ios::out);
        if (!fpO_) throw std::runtime_error(outputFileName_ + ": cannot open for writing");
    }

    buffer_.reserve(cache_size_);
}

/*------------------------------------------------------------*/
/*                         destructor                         */
/*------------------------------------------------------------*/
RouteWriter::~RouteWriter() {
    // never throws
    try {
        flush();
    } catch (const std::runtime_error& e) {
        error_stream() << e.what() << "\n";
    }
}

/*------------------------------------------------------------*/
/*                          flush                             */
/*------------------------------------------------------------*/
void RouteWriter::flush() {
    if (buffer_.empty()) return;

    if (is_gzip_) {
        int n = gzwrite(gzfpO_.get(), buffer_.data(), static_cast<unsigned int>(buffer_.size()));
        if (n <= 0) throw std::runtime_error(outputFileName_ + ": gzwrite failed");
    } else if (!outputFileName_.empty()) {
        fpO_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (!fpO_) throw std::runtime_error(outputFileName_ + ": write failed");
        fpO_.flush();
    } else {
        std::cout.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        std::cout.flush();
    }
    buffer_.clear();
}

/*------------------------------------------------------------*/
/*                        write_line                          */
/*------------------------------------------------------------*/
void RouteWriter::write_line(const std::string& line) {
    buffer_.append(line);
    buffer_.push_back('\n');
    ++lines_;

    if (buffer_.size() >= cache_size_) flush();
}

} // namespace routemap
