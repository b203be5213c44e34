#ifndef ROUTEMAP_ROUTE_WRITER_HPP
#define ROUTEMAP_ROUTE_WRITER_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <memory>
#include <zlib.h>

namespace routemap {

/**
 * @brief buffered text output for query results
 *
 * An empty file name writes to stdout; a name ending in ".gz" is
 * written gzip-compressed. Throws std::runtime_error if the file
 * cannot be opened or written.
**/
class RouteWriter
{
private:
    std::string outputFileName_;

    bool is_gzip_{false};

    // file handles
    std::ofstream fpO_;
    std::unique_ptr<gzFile_s, int(*)(gzFile)> gzfpO_{nullptr, gzclose};

    // internal write buffer
    std::string buffer_;
    size_t cache_size_{1 << 20};     // default 1 MB

    uint64_t lines_{0};

    RouteWriter(const RouteWriter&) = delete;
    RouteWriter& operator=(const RouteWriter&) = delete;

public:
    explicit RouteWriter(const std::string& outFileName = "", size_t cacheSize = 1 << 20);
    ~RouteWriter();

    // Append one line (a trailing '\n' is added)
    void write_line(const std::string& line);

    /* flush internal buffer to file */
    void flush();

    uint64_t lines() const { return lines_; }
};

} // namespace routemap

#endif
