// BADPATH - Path Checker Tests
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include <gtest/gtest.h>

#include <badpath/checker/checker.h>
#include <badpath/checker/normalizer.h>
#include <badpath/checker/registry.h>
#include <badpath/platform/platform.h>
#include <badpath/util/fs.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

namespace badpath {
namespace test {

namespace {

// Never created by the tests; only the lexical location matters
const char* const SYSTEM_FILE = "/etc/badpath_test_missing.conf";

std::string WithNul(const std::string& before, const std::string& after) {
    return before + std::string(1, '\0') + after;
}

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class PathCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        originalCwd_ = util::fs::CurrentPath();
        dir_ = util::fs::CreateTempDirectory("badpath_checker_", "/tmp");
        ASSERT_FALSE(dir_.empty());
        registry_ = std::make_shared<checker::UserPathRegistry>();
        ClearUserPaths();
    }

    void TearDown() override {
        ClearUserPaths();
        util::fs::SetCurrentPath(originalCwd_);
        util::fs::RemoveAll(dir_);
    }

    PathChecker Make(const std::string& path, const CheckerOptions& options = CheckerOptions()) {
        return PathChecker(path, options, registry_);
    }

    static bool IsRoot() { return geteuid() == 0; }

    std::string originalCwd_;
    std::string dir_;
    std::shared_ptr<checker::UserPathRegistry> registry_;
};

// ============================================================================
// Options
// ============================================================================

TEST(CheckerOptionsTest, Defaults) {
    CheckerOptions options;
    EXPECT_FALSE(options.systemOk);
    EXPECT_FALSE(options.userPathsOk);
    EXPECT_FALSE(options.notWriteable);
    EXPECT_FALSE(options.cwdOnly);
    EXPECT_FALSE(options.raiseError);
}

TEST(CheckerOptionsTest, ForMode) {
    CheckerOptions read = CheckerOptions::ForMode(AccessMode::Read);
    EXPECT_TRUE(read.systemOk);
    EXPECT_TRUE(read.userPathsOk);
    EXPECT_TRUE(read.notWriteable);
    EXPECT_FALSE(read.cwdOnly);

    CheckerOptions write = CheckerOptions::ForMode(AccessMode::Write);
    EXPECT_FALSE(write.systemOk);
    EXPECT_FALSE(write.userPathsOk);
    EXPECT_FALSE(write.notWriteable);
}

TEST(CheckerOptionsTest, ParseAccessMode) {
    EXPECT_EQ(ParseAccessMode("read"), AccessMode::Read);
    EXPECT_EQ(ParseAccessMode("write"), AccessMode::Write);
    EXPECT_STREQ(AccessModeToString(AccessMode::Read), "read");

    EXPECT_THROW(ParseAccessMode("READ"), std::invalid_argument);
    EXPECT_THROW(ParseAccessMode(""), std::invalid_argument);
    try {
        ParseAccessMode("append");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Invalid mode 'append'", 0), 0u);
    }
}

TEST(DangerReasonsTest, ToString) {
    DangerReasons reasons;
    EXPECT_FALSE(reasons.Any());
    EXPECT_EQ(reasons.ToString(), "none");

    reasons.systemPath = true;
    reasons.outsideCwd = true;
    EXPECT_TRUE(reasons.Any());
    EXPECT_EQ(reasons.ToString(), "system,outside-cwd");

    DangerReasons other;
    EXPECT_NE(reasons, other);
    other.systemPath = true;
    other.outsideCwd = true;
    EXPECT_EQ(reasons, other);
}

// ============================================================================
// Classification
// ============================================================================

TEST_F(PathCheckerTest, OrdinaryPathIsSafe) {
    PathChecker checker = Make(dir_ + "/output.txt");
    EXPECT_TRUE(checker.IsSafe());
    EXPECT_FALSE(checker.IsDangerous());
    EXPECT_TRUE(static_cast<bool>(checker));
    EXPECT_EQ(checker.Reasons().ToString(), "none");
    EXPECT_FALSE(checker.IsSystemPath());
    EXPECT_FALSE(checker.IsSensitivePath());
    EXPECT_FALSE(checker.HasInvalidChars());
    EXPECT_FALSE(checker.IsOutsideCwd().has_value());
    EXPECT_EQ(checker.Path(), dir_ + "/output.txt");
    EXPECT_EQ(checker.NormalizedPath(), checker::Normalize(dir_ + "/output.txt"));
}

TEST_F(PathCheckerTest, SystemPathIsDangerous) {
    PathChecker checker = Make(SYSTEM_FILE);
    EXPECT_FALSE(checker);
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_TRUE(checker.IsSystemPath());
    EXPECT_EQ(checker.Reasons().ToString(), "system");
}

TEST_F(PathCheckerTest, TraversalIntoSystemPathIsDangerous) {
    PathChecker checker = Make(dir_ + "/../../etc/badpath_test_missing.conf");
    EXPECT_TRUE(checker.IsSystemPath());
    EXPECT_TRUE(checker.IsDangerous());
}

TEST_F(PathCheckerTest, SymlinkThenParentIntoSystemPath) {
    if (!util::fs::IsDirectory("/etc/ssl")) {
        GTEST_SKIP() << "/etc/ssl not present";
    }
    ASSERT_TRUE(util::fs::CreateSymlink("/etc/ssl", dir_ + "/link"));

    PathChecker checker = Make(dir_ + "/link/../badpath_test_new_file");
    EXPECT_TRUE(checker.IsSystemPath());
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_TRUE(IsSystemPath(dir_ + "/link/../badpath_test_new_file"));
}

TEST_F(PathCheckerTest, CwdOnlyCannotBeEscapedThroughSymlink) {
    ASSERT_TRUE(util::fs::CreateDirectory(dir_ + "/work"));
    ASSERT_TRUE(util::fs::CreateDirectory(dir_ + "/elsewhere"));
    ASSERT_TRUE(util::fs::CreateDirectory(dir_ + "/elsewhere/deep"));
    ASSERT_TRUE(util::fs::CreateSymlink(dir_ + "/elsewhere/deep", dir_ + "/work/hop"));
    ASSERT_TRUE(util::fs::SetCurrentPath(dir_ + "/work"));

    CheckerOptions options;
    options.cwdOnly = true;
    PathChecker checker = Make("hop/../escape.txt", options);
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_TRUE(checker.Reasons().outsideCwd);
}

TEST_F(PathCheckerTest, SystemOkWaivesSystemRule) {
    CheckerOptions options;
    options.systemOk = true;
    PathChecker checker = Make(SYSTEM_FILE, options);
    EXPECT_TRUE(checker.IsSafe());
    // The flag itself is still reported
    EXPECT_TRUE(checker.IsSystemPath());
}

TEST_F(PathCheckerTest, ReadModeAllowsExistingSystemFile) {
    PathChecker checker = Make("/etc/passwd", CheckerOptions::ForMode(AccessMode::Read));
    EXPECT_TRUE(checker.IsSafe());

    PathChecker strict = Make("/etc/passwd", CheckerOptions::ForMode(AccessMode::Write));
    EXPECT_TRUE(strict.IsDangerous());
    EXPECT_TRUE(strict.Reasons().systemPath);
}

TEST_F(PathCheckerTest, SensitivePathFromRegistry) {
    registry_->Add(dir_ + "/secrets");

    PathChecker checker = Make(dir_ + "/secrets/id_rsa");
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_TRUE(checker.IsSensitivePath());
    EXPECT_FALSE(checker.IsSystemPath());
    EXPECT_EQ(checker.Reasons().ToString(), "sensitive");

    CheckerOptions options;
    options.userPathsOk = true;
    EXPECT_TRUE(Make(dir_ + "/secrets/id_rsa", options).IsSafe());

    EXPECT_TRUE(Make(dir_ + "/secrets-public/id_rsa.pub").IsSafe());
}

TEST_F(PathCheckerTest, NullRegistryUsesProcessWideRegistry) {
    AddUserPath(dir_ + "/guarded");
    PathChecker checker(dir_ + "/guarded/file");
    EXPECT_TRUE(checker.IsSensitivePath());

    // A private registry does not see process-wide entries
    EXPECT_FALSE(Make(dir_ + "/guarded/file").IsSensitivePath());
}

TEST_F(PathCheckerTest, InvalidCharactersAreNeverWaived) {
    PathChecker checker = Make(WithNul(dir_ + "/a", "b"),
                               CheckerOptions::ForMode(AccessMode::Read));
    EXPECT_TRUE(checker.HasInvalidChars());
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_FALSE(checker.IsReadable());
    EXPECT_FALSE(checker.IsCreatable());
}

TEST_F(PathCheckerTest, SeveralReasonsReported) {
    PathChecker checker = Make(WithNul("/etc/a", "b"));
    EXPECT_TRUE(checker.Reasons().invalidChars);
    EXPECT_TRUE(checker.Reasons().systemPath);
    EXPECT_EQ(checker.Reasons().ToString(), "invalid-chars,system");
}

// ============================================================================
// Confinement
// ============================================================================

TEST_F(PathCheckerTest, CwdOnly) {
    ASSERT_TRUE(util::fs::CreateDirectory(dir_ + "/work"));
    ASSERT_TRUE(util::fs::SetCurrentPath(dir_ + "/work"));

    CheckerOptions options;
    options.cwdOnly = true;

    PathChecker inside = Make("notes/today.txt", options);
    EXPECT_TRUE(inside.IsSafe());
    ASSERT_TRUE(inside.IsOutsideCwd().has_value());
    EXPECT_FALSE(*inside.IsOutsideCwd());

    PathChecker outside = Make("../escape.txt", options);
    EXPECT_TRUE(outside.IsDangerous());
    ASSERT_TRUE(outside.IsOutsideCwd().has_value());
    EXPECT_TRUE(*outside.IsOutsideCwd());
    EXPECT_EQ(outside.Reasons().ToString(), "outside-cwd");

    // Without the option the same path is fine
    PathChecker unconfined = Make("../escape.txt");
    EXPECT_TRUE(unconfined.IsSafe());
    EXPECT_FALSE(unconfined.IsOutsideCwd().has_value());
}

TEST_F(PathCheckerTest, CwdOnlyIsNotWaivedByReadMode) {
    ASSERT_TRUE(util::fs::SetCurrentPath(dir_));
    CheckerOptions options = CheckerOptions::ForMode(AccessMode::Read);
    options.cwdOnly = true;
    EXPECT_TRUE(Make("/tmp", options).IsDangerous());
}

// ============================================================================
// Accessibility
// ============================================================================

TEST_F(PathCheckerTest, AccessibilityOfExistingFile) {
    std::string file = dir_ + "/existing.txt";
    ASSERT_TRUE(util::fs::WriteFile(file, "data"));

    PathChecker checker = Make(file);
    EXPECT_TRUE(checker.IsSafe());
    EXPECT_TRUE(checker.IsReadable());
    EXPECT_TRUE(checker.IsWritable());
    EXPECT_FALSE(checker.IsCreatable());
}

TEST_F(PathCheckerTest, AccessibilityOfMissingFile) {
    PathChecker checker = Make(dir_ + "/later/new.txt");
    EXPECT_FALSE(checker.IsReadable());
    EXPECT_FALSE(checker.IsWritable());
    EXPECT_TRUE(checker.IsCreatable());
}

TEST_F(PathCheckerTest, AccessibilityIsCached) {
    std::string file = dir_ + "/cached.txt";
    PathChecker checker = Make(file);
    EXPECT_TRUE(checker.IsCreatable());

    ASSERT_TRUE(util::fs::WriteFile(file, "now it exists"));
    EXPECT_TRUE(checker.IsCreatable());
    // First probe happens now
    EXPECT_TRUE(checker.IsReadable());
}

TEST_F(PathCheckerTest, ReadOnlyFileIsDangerousForWriting) {
    if (IsRoot()) {
        GTEST_SKIP() << "root bypasses permission bits";
    }
    std::string file = dir_ + "/readonly.txt";
    ASSERT_TRUE(util::fs::WriteFile(file, "data"));
    ASSERT_TRUE(util::fs::SetPermissions(file, 0444));

    PathChecker checker = Make(file);
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_EQ(checker.Reasons().ToString(), "not-writable");

    CheckerOptions options;
    options.notWriteable = true;
    EXPECT_TRUE(Make(file, options).IsSafe());
    EXPECT_TRUE(Make(file, CheckerOptions::ForMode(AccessMode::Read)).IsSafe());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(PathCheckerTest, RaiseErrorThrowsFromConstructor) {
    CheckerOptions options;
    options.raiseError = true;
    try {
        Make(SYSTEM_FILE, options);
        FAIL() << "expected DangerousPathError";
    } catch (const DangerousPathError& e) {
        EXPECT_EQ(std::string(e.what()),
                  std::string("Path '") + SYSTEM_FILE + "' points to a dangerous location");
        EXPECT_EQ(e.Path(), SYSTEM_FILE);
        EXPECT_TRUE(e.Reasons().systemPath);
    }
}

TEST_F(PathCheckerTest, RaiseErrorQuietForSafePath) {
    CheckerOptions options;
    options.raiseError = true;
    EXPECT_NO_THROW(Make(dir_ + "/fine.txt", options));
}

TEST_F(PathCheckerTest, DangerousPathErrorIsRuntimeError) {
    CheckerOptions options;
    options.raiseError = true;
    EXPECT_THROW(Make(SYSTEM_FILE, options), std::runtime_error);
}

// ============================================================================
// Re-evaluation
// ============================================================================

TEST_F(PathCheckerTest, CheckOtherPathLeavesStateAlone) {
    PathChecker checker = Make(dir_ + "/safe.txt");
    EXPECT_TRUE(checker.Check(SYSTEM_FILE));
    EXPECT_FALSE(checker.Check(dir_ + "/other.txt"));

    EXPECT_TRUE(checker.IsSafe());
    EXPECT_EQ(checker.Path(), dir_ + "/safe.txt");

    EXPECT_THROW(checker.Check(SYSTEM_FILE, true), DangerousPathError);
    EXPECT_NO_THROW(checker.Check(dir_ + "/other.txt", true));
}

TEST_F(PathCheckerTest, CheckUsesOptions) {
    PathChecker reader = Make(dir_ + "/safe.txt", CheckerOptions::ForMode(AccessMode::Read));
    EXPECT_FALSE(reader.Check(SYSTEM_FILE));
    EXPECT_TRUE(reader.Check(WithNul(dir_ + "/x", "")));
}

TEST_F(PathCheckerTest, CheckUsesRegistrySnapshot) {
    PathChecker checker = Make(dir_ + "/data/file.db");
    registry_->Add(dir_ + "/data");

    // Snapshot predates the registration
    EXPECT_FALSE(checker.Check(dir_ + "/data/other.db"));
    EXPECT_TRUE(checker.IsSafe());

    // Recheck reloads it
    EXPECT_TRUE(checker.Recheck());
    EXPECT_TRUE(checker.IsDangerous());
    EXPECT_TRUE(checker.IsSensitivePath());
    EXPECT_TRUE(checker.Check(dir_ + "/data/other.db"));
}

TEST_F(PathCheckerTest, RecheckAfterRemoval) {
    registry_->Add(dir_ + "/data");
    PathChecker checker = Make(dir_ + "/data/file.db");
    EXPECT_TRUE(checker.IsDangerous());

    registry_->Remove(dir_ + "/data");
    EXPECT_FALSE(checker.Recheck());
    EXPECT_TRUE(checker.IsSafe());
}

TEST_F(PathCheckerTest, RecheckRaises) {
    PathChecker checker = Make(dir_ + "/data/file.db");
    registry_->Add(dir_ + "/data");
    EXPECT_THROW(checker.Recheck(true), DangerousPathError);
}

// ============================================================================
// Representation
// ============================================================================

TEST_F(PathCheckerTest, ToStringAndStream) {
    PathChecker safe = Make(dir_ + "/x.txt");
    EXPECT_EQ(safe.ToString(), "PathChecker('" + dir_ + "/x.txt', safe)");

    PathChecker dangerous = Make(SYSTEM_FILE);
    std::ostringstream oss;
    oss << dangerous;
    EXPECT_EQ(oss.str(), std::string("PathChecker('") + SYSTEM_FILE + "', dangerous)");
}

// ============================================================================
// Free Functions
// ============================================================================

TEST_F(PathCheckerTest, IsDangerousPath) {
    EXPECT_TRUE(IsDangerousPath(SYSTEM_FILE));
    EXPECT_FALSE(IsDangerousPath(dir_ + "/ok.txt"));
    EXPECT_NO_THROW(IsDangerousPath(dir_ + "/ok.txt", true));

    try {
        IsDangerousPath(SYSTEM_FILE, true);
        FAIL() << "expected DangerousPathError";
    } catch (const DangerousPathError& e) {
        EXPECT_EQ(std::string(e.what()),
                  std::string("Path '") + SYSTEM_FILE + "' points to a dangerous system location");
        EXPECT_EQ(e.Path(), SYSTEM_FILE);
    }
}

TEST_F(PathCheckerTest, IsDangerousPathSeesUserPaths) {
    AddUserPath(dir_ + "/private");
    EXPECT_TRUE(IsDangerousPath(dir_ + "/private/diary.txt"));
    ClearUserPaths();
    EXPECT_FALSE(IsDangerousPath(dir_ + "/private/diary.txt"));
}

TEST_F(PathCheckerTest, SystemAndSensitiveAreSeparate) {
    AddUserPath(dir_ + "/private");

    EXPECT_TRUE(IsSystemPath(SYSTEM_FILE));
    EXPECT_FALSE(IsSensitivePath(SYSTEM_FILE));

    EXPECT_FALSE(IsSystemPath(dir_ + "/private/x"));
    EXPECT_TRUE(IsSensitivePath(dir_ + "/private/x"));
}

TEST_F(PathCheckerTest, UserPathManagement) {
    AddUserPath("/srv/one");
    AddUserPath("/srv/two");
    AddUserPath("/srv/one");

    auto paths = GetUserPaths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], "/srv/one");
    EXPECT_EQ(paths[1], "/srv/two");

    RemoveUserPath("/srv/one");
    EXPECT_EQ(GetUserPaths().size(), 1u);
    EXPECT_THROW(RemoveUserPath("/srv/one"), std::invalid_argument);

    ClearUserPaths();
    EXPECT_TRUE(GetUserPaths().empty());
}

TEST_F(PathCheckerTest, DangerousPathsListing) {
    EXPECT_EQ(GetSystemPaths(), DangerousPrefixes(HostPlatform()));
    EXPECT_EQ(GetDangerousPaths(), GetSystemPaths());

    const std::string systemEntry = GetSystemPaths().front();
    AddUserPath("/srv/custom");
    AddUserPath(systemEntry);

    auto all = GetDangerousPaths();
    EXPECT_EQ(all.size(), GetSystemPaths().size() + 1);
    EXPECT_EQ(all.back(), "/srv/custom");
    EXPECT_EQ(std::count(all.begin(), all.end(), systemEntry), 1);
}

} // namespace test
} // namespace badpath
