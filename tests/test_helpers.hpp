#pragma once
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <fstream>
#include <cstdio>
#include <stdexcept>
#include <zlib.h>

#include "../include/digraph.hpp"

namespace test_utils {

/**
 * The reference network:
 * A->B:5, B->C:4, C->D:8, D->C:8, D->E:6, A->D:5, C->E:2, E->B:3, A->E:7
 */
inline routemap::WeightedDigraph create_sample_graph() {
    routemap::WeightedDigraph g;
    g.add_edge("A", "B", 5);
    g.add_edge("B", "C", 4);
    g.add_edge("C", "D", 8);
    g.add_edge("D", "C", 8);
    g.add_edge("D", "E", 6);
    g.add_edge("A", "D", 5);
    g.add_edge("C", "E", 2);
    g.add_edge("E", "B", 3);
    g.add_edge("A", "E", 7);
    return g;
}

inline std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + name;
}

inline std::string write_text_file(const std::string& name, const std::string& content) {
    const std::string path = temp_path(name);
    std::ofstream out(path, std::ios::binary);
    out << content;
    out.close();
    if (!out) throw std::runtime_error("cannot write test fixture " + path);
    return path;
}

inline std::string write_gz_file(const std::string& name, const std::string& content) {
    const std::string path = temp_path(name);
    gzFile fp = gzopen(path.c_str(), "wb");
    if (!fp) throw std::runtime_error("cannot open gzip test fixture " + path);
    const int n = gzwrite(fp, content.data(), static_cast<unsigned>(content.size()));
    const int rc = gzclose(fp);
    if (n != static_cast<int>(content.size()) || rc != Z_OK) {
        throw std::runtime_error("cannot write gzip test fixture " + path);
    }
    return path;
}

inline std::string read_gz_file(const std::string& path) {
    std::string out;
    gzFile fp = gzopen(path.c_str(), "rb");
    if (!fp) return out;
    char buf[4096];
    int n;
    while ((n = gzread(fp, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    gzclose(fp);
    return out;
}

inline routemap::Route route_of(const routemap::WeightedDigraph& g, const std::string& stations) {
    routemap::Route r;
    for (char c : stations) r.push_back(*g.node_id(std::string(1, c)));
    return r;
}

} // namespace test_utils
