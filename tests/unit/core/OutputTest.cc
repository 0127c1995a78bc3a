#include "fleet/core/Output.hh"
#include <gtest/gtest.h>

#include <sstream>

using namespace fleet;

TEST(OutputTest, StreamOutputAppendsNewlines) {
    std::ostringstream stream;
    StreamOutput output(stream);
    output.write("A: completed");
    output.write("B: failed - boom");
    EXPECT_EQ(stream.str(), "A: completed\nB: failed - boom\n");
}

TEST(OutputTest, BufferOutputKeepsOrder) {
    BufferOutput output;
    output.write("first");
    output.write("second");

    EXPECT_EQ(output.lines(), (std::vector<std::string>{"first", "second"}));
    EXPECT_TRUE(output.contains("sec"));
    EXPECT_FALSE(output.contains("third"));

    output.clear();
    EXPECT_TRUE(output.lines().empty());
}

TEST(OutputTest, LogOutputAcceptsLines) {
    LogOutput output;
    EXPECT_NO_THROW(output.write("logged line"));
}
