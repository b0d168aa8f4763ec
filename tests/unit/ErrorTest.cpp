#include "error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>

using namespace cdihook;

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::NotFound), "NotFound");
    EXPECT_STREQ(error_kind_name(ErrorKind::SubprocessError), "SubprocessError");
}

TEST(ErrorTest, ErrnoMapping) {
    EXPECT_EQ(make_errno_error("x", "/p", ENOENT).kind, ErrorKind::NotFound);
    EXPECT_EQ(make_errno_error("x", "/p", EACCES).kind, ErrorKind::IOError);
}

TEST(ErrorTest, RendersPathEntryAndCause) {
    Error err = make_error(ErrorKind::IOError, "Failed creating the CDI symlink", "/r/a/b", EACCES);
    err.entry_index = 2;
    err.link = "/a/b";
    err.target = "/c";

    EXPECT_EQ(err.to_string(), std::string("Failed creating the CDI symlink at \"/r/a/b\" "
                                           "(entry 2, link: \"/a/b\", target: \"/c\"): ") +
                                   strerror(EACCES));
}

TEST(ErrorTest, RendersSubprocessOutput) {
    Error err = make_error(ErrorKind::SubprocessError, "Failed running ldconfig");
    err.exit_code = 1;
    err.output = "ldconfig: oops\n";

    EXPECT_EQ(err.to_string(), "Failed running ldconfig: exit status 1: ldconfig: oops");
}
