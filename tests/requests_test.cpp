#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sandbox/requests.hpp"
#include "sandbox/sandbox_error.hpp"

using ilbox::sandbox::ErrorCode;
using ilbox::sandbox::SandboxError;
namespace sb = ilbox::sandbox;

namespace {

template <typename Fn>
bool Rejected(Fn&& fn) {
    try {
        fn();
    } catch (const SandboxError& ex) {
        return ex.Code() == ErrorCode::kInvalidRequest;
    }
    return false;
}

}  // namespace

// NOLINTNEXTLINE
TEST(requests, user_id_syntax) {
    EXPECT_TRUE(sb::IsValidUserId("1234567890"));
    EXPECT_TRUE(sb::IsValidUserId("alice_B-2"));
    EXPECT_TRUE(sb::IsValidUserId(std::string(64, 'a')));
    EXPECT_FALSE(sb::IsValidUserId(std::string(65, 'a')));
    EXPECT_FALSE(sb::IsValidUserId(""));
    EXPECT_FALSE(sb::IsValidUserId(".."));
    EXPECT_FALSE(sb::IsValidUserId("a/b"));
    EXPECT_FALSE(sb::IsValidUserId("a b"));
}

// NOLINTNEXTLINE
TEST(requests, extract_code_block_strips_fences) {
    EXPECT_EQ(sb::ExtractCodeBlock("```python\nprint(1)\n```"), "print(1)");
    EXPECT_EQ(sb::ExtractCodeBlock("```py\nprint(2)\n```"), "print(2)");
    EXPECT_EQ(sb::ExtractCodeBlock("```\nprint(3)\n```"), "print(3)");
    EXPECT_EQ(sb::ExtractCodeBlock("`print(4)`"), "print(4)");
    EXPECT_EQ(sb::ExtractCodeBlock("  print(5)  \n"), "print(5)");
}

// NOLINTNEXTLINE
TEST(requests, run_request_requires_code) {
    EXPECT_TRUE(Rejected([] { sb::MakeRunRequest("alice", "   "); }));
    EXPECT_TRUE(Rejected([] { sb::MakeRunRequest("alice", "``````"); }));
    EXPECT_TRUE(Rejected([] { sb::MakeRunRequest("bad id", "print(1)"); }));
    EXPECT_TRUE(Rejected([] { sb::MakeRunRequest("alice", std::string(sb::kMaxCodeBytes + 1, 'x')); }));

    const auto request = sb::MakeRunRequest("alice", "```python\nprint(1)\n```", " sub ");
    EXPECT_EQ(request.code, "print(1)");
    EXPECT_EQ(request.workdir, "sub");
}

// NOLINTNEXTLINE
TEST(requests, package_allow_list) {
    EXPECT_TRUE(sb::IsValidPackageSpec("requests"));
    EXPECT_TRUE(sb::IsValidPackageSpec("numpy==1.26.4"));
    EXPECT_TRUE(sb::IsValidPackageSpec("uvicorn[standard]>=0.20,<1"));
    EXPECT_TRUE(sb::IsValidPackageSpec("pkg~=2.0"));
    EXPECT_FALSE(sb::IsValidPackageSpec("--index-url=http://evil"));
    EXPECT_FALSE(sb::IsValidPackageSpec("-e"));
    EXPECT_FALSE(sb::IsValidPackageSpec("git+https://example.com/x.git"));
    EXPECT_FALSE(sb::IsValidPackageSpec("a;rm"));
    EXPECT_FALSE(sb::IsValidPackageSpec("../local"));
    EXPECT_FALSE(sb::IsValidPackageSpec(std::string(sb::kMaxPackageLength + 1, 'a')));
}

// NOLINTNEXTLINE
TEST(requests, install_request_parses_whitespace_list) {
    const auto request = sb::MakeInstallRequest("alice", "  requests \n numpy==1.26 ");
    ASSERT_EQ(request.packages.size(), 2u);
    EXPECT_EQ(request.packages[0], "requests");
    EXPECT_EQ(request.packages[1], "numpy==1.26");

    EXPECT_TRUE(Rejected([] { sb::MakeInstallRequest("alice", "   "); }));
    EXPECT_TRUE(Rejected([] { sb::MakeInstallRequest("alice", "ok --pre"); }));
    std::vector<std::string> many(sb::kMaxPackages + 1, "pkg");
    EXPECT_TRUE(Rejected([&] { sb::MakeInstallRequest("alice", many); }));
}

// NOLINTNEXTLINE
TEST(requests, file_requests_require_path) {
    EXPECT_TRUE(Rejected([] { sb::MakeWriteRequest("alice", "  ", "x"); }));
    EXPECT_TRUE(Rejected([] { sb::MakeRemoveRequest("alice", "", true); }));
    EXPECT_TRUE(Rejected([] { sb::MakeListRequest("alice", "", -1); }));
    EXPECT_TRUE(Rejected([] { sb::MakeWriteRequest("alice", "big", std::string(sb::kMaxWriteBytes + 1, 'x')); }));

    const auto list = sb::MakeListRequest("alice", "", 0);
    EXPECT_EQ(list.path, "");
    const auto remove = sb::MakeRemoveRequest("alice", " dir ", true);
    EXPECT_EQ(remove.path, "dir");
    EXPECT_TRUE(remove.recursive);
}
