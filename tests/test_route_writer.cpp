#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "../include/route_writer.hpp"
#include "test_helpers.hpp"

using routemap::RouteWriter;

TEST(RouteWriterTest, WritesPlainFile) {
    const std::string path = test_utils::temp_path("routes_out.txt");
    {
        RouteWriter w(path, 4);  // tiny cache forces intermediate flushes
        w.write_line("CDC");
        w.write_line("CEBC");
        EXPECT_EQ(w.lines(), 2u);
    }

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "CDC\nCEBC\n");
}

TEST(RouteWriterTest, WritesGzipFile) {
    const std::string path = test_utils::temp_path("routes_out.txt.gz");
    {
        RouteWriter w(path);
        w.write_line("A-B-C");
    }

    EXPECT_EQ(test_utils::read_gz_file(path), "A-B-C\n");
}

TEST(RouteWriterTest, UnwritablePathThrows) {
    EXPECT_THROW(RouteWriter{test_utils::temp_path("no_such_dir/out.txt")}, std::runtime_error);
}
