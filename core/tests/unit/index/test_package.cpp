#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "pkgindex/index/package.hpp"
#include "pkgindex/index/package_error.hpp"
#include "pkgindex/index/package_registry.hpp"

using pkgindex::File;
using pkgindex::FileKind;
using pkgindex::Package;
using pkgindex::PackageError;
using pkgindex::PackageErrorKind;
using pkgindex::PackagePtr;
using pkgindex::PackageRegistry;

namespace
{

File make_file(const std::string & dir, const std::string & name, int64_t mtime = 1)
{
  File f;
  f.name = name;
  f.path = dir + "/" + name;
  f.stat.name = name;
  f.stat.mtime_ns = mtime;
  f.stat.size = 10;
  return f;
}

PackagePtr make_package(
  const std::string & src_root, const std::string & import_path, const std::string & name)
{
  auto pkg = std::make_shared<Package>();
  pkg->src_root = src_root;
  pkg->import_path = import_path;
  pkg->dir = src_root + "/" + import_path;
  pkg->name = name;
  pkg->add_file(FileKind::GoFile, make_file(pkg->dir, "a.go"));
  return pkg;
}

}  // namespace

TEST(IndexPackage, FileLivesInExactlyOneClass)
{
  Package pkg;
  pkg.dir = "/src/p";
  pkg.add_file(FileKind::GoFile, make_file(pkg.dir, "a.go"));
  pkg.add_file(FileKind::TestGoFile, make_file(pkg.dir, "a_test.go"));
  pkg.add_file(FileKind::IgnoredGoFile, make_file(pkg.dir, "b.go"));

  EXPECT_EQ(pkg.file_count(), 3U);
  EXPECT_EQ(pkg.kind_of("b.go"), FileKind::IgnoredGoFile);

  // Moving b.go to GoFile removes it from IgnoredGoFile.
  pkg.add_file(FileKind::GoFile, make_file(pkg.dir, "b.go", 2));
  EXPECT_EQ(pkg.file_count(), 3U);
  EXPECT_EQ(pkg.kind_of("b.go"), FileKind::GoFile);
  EXPECT_EQ(pkg.file_count(FileKind::IgnoredGoFile), 0U);
  EXPECT_EQ(pkg.lookup_file("b.go")->stat.mtime_ns, 2);

  EXPECT_TRUE(pkg.remove_file("a_test.go"));
  EXPECT_FALSE(pkg.remove_file("a_test.go"));
  EXPECT_FALSE(pkg.kind_of("a_test.go").has_value());
  EXPECT_EQ(pkg.lookup_file("a_test.go"), nullptr);
}

TEST(IndexPackage, FilesAreSortedAcrossClasses)
{
  Package pkg;
  pkg.dir = "/src/p";
  pkg.add_file(FileKind::GoFile, make_file(pkg.dir, "z.go"));
  pkg.add_file(FileKind::TestGoFile, make_file(pkg.dir, "m_test.go"));
  pkg.add_file(FileKind::IgnoredGoFile, make_file(pkg.dir, "a_windows.go"));

  const std::vector<std::string> all = {"a_windows.go", "m_test.go", "z.go"};
  EXPECT_EQ(pkg.file_names(), all);

  const std::vector<std::string> buildable = {"z.go"};
  EXPECT_EQ(pkg.file_names(FileKind::GoFile), buildable);

  const std::vector<std::string> paths = {"/src/p/m_test.go", "/src/p/z.go"};
  EXPECT_EQ(pkg.file_paths(FileKind::GoFile | FileKind::TestGoFile), paths);
}

TEST(IndexPackage, ForEachFileMayModify)
{
  Package pkg;
  pkg.add_file(FileKind::GoFile, make_file("/src/p", "a.go"));
  pkg.lookup_file("a.go")->clause_name = "p";
  pkg.lookup_file("a.go")->clause = pkgindex::ClauseState::Parsed;

  int visited = 0;
  pkg.for_each_file([&visited](FileKind kind, File & f) {
    EXPECT_EQ(kind, FileKind::GoFile);
    f.forget_clause();
    ++visited;
  });
  EXPECT_EQ(visited, 1);
  EXPECT_EQ(pkg.lookup_file("a.go")->clause, pkgindex::ClauseState::Unknown);
  EXPECT_TRUE(pkg.lookup_file("a.go")->clause_name.empty());
}

TEST(IndexPackage, EqualityIgnoresCachedClauses)
{
  Package a;
  a.dir = "/src/p";
  a.name = "p";
  a.add_file(FileKind::GoFile, make_file(a.dir, "a.go"));
  Package b = a;

  b.lookup_file("a.go")->clause_name = "p";
  EXPECT_EQ(a, b);

  b.add_file(FileKind::GoFile, make_file(b.dir, "a.go", 5));
  EXPECT_FALSE(a == b);
}

TEST(IndexPackage, CommandAndValidity)
{
  Package pkg;
  EXPECT_FALSE(pkg.is_valid());
  pkg.name = "main";
  EXPECT_FALSE(pkg.is_valid());
  pkg.add_file(FileKind::GoFile, make_file("/src/cmd", "main.go"));
  EXPECT_TRUE(pkg.is_valid());
  EXPECT_TRUE(pkg.is_command());
}

TEST(IndexPackage, FileKindNames)
{
  EXPECT_EQ(pkgindex::to_string(FileKind::GoFile), "GoFile");
  EXPECT_EQ(pkgindex::to_string(FileKind::TestGoFile), "TestGoFile");
  EXPECT_EQ(pkgindex::to_string(FileKind::IgnoredGoFile), "IgnoredGoFile");
  EXPECT_TRUE(pkgindex::has_kind(FileKind::Any, FileKind::TestGoFile));
  EXPECT_FALSE(pkgindex::has_kind(FileKind::GoFile, FileKind::TestGoFile));
}

TEST(IndexPackageError, Messages)
{
  EXPECT_TRUE(PackageError{}.ok());
  EXPECT_TRUE(PackageError{}.message().empty());

  const auto none = PackageError::no_buildable_sources("/src/p");
  EXPECT_FALSE(none.ok());
  EXPECT_EQ(none.kind, PackageErrorKind::NoBuildableSources);
  EXPECT_EQ(none.message(), "no buildable Go source files in /src/p");

  EXPECT_EQ(
    PackageError::no_go_files("/src/q").message(), "no buildable Go source files in /src/q");

  const auto multi = PackageError::multiple_packages("/src/p", {"p", "q"}, {"a.go", "b.go"});
  EXPECT_EQ(multi.kind, PackageErrorKind::MultiplePackages);
  EXPECT_EQ(multi.message(), "found packages p (a.go) and q (b.go) in /src/p");
  EXPECT_EQ(multi, PackageError::multiple_packages("/src/p", {"p", "q"}, {"a.go", "b.go"}));
  EXPECT_FALSE(multi == PackageError::multiple_packages("/src/p", {"p", "r"}, {"a.go", "b.go"}));
}

TEST(IndexPackageRegistry, InsertAndLookup)
{
  PackageRegistry reg;
  reg.insert(make_package("/go/src", "net/http", "http"));
  reg.insert(make_package("/go/src", "cmd/tool", "main"));

  EXPECT_EQ(reg.size(), 2U);
  ASSERT_NE(reg.lookup("/go/src", "net/http"), nullptr);
  EXPECT_EQ(reg.lookup("/go/src", "net/http")->name, "http");
  EXPECT_EQ(reg.lookup("/other", "net/http"), nullptr);

  ASSERT_NE(reg.lookup_by_path("/go/src/net/http"), nullptr);
  EXPECT_EQ(reg.lookup_by_path("/go/src/net/http")->import_path, "net/http");
  EXPECT_EQ(reg.lookup_by_path("/go/src/net"), nullptr);
  EXPECT_EQ(reg.lookup_by_path("/elsewhere/net/http"), nullptr);

  ASSERT_NE(reg.lookup_by_name("http"), nullptr);
  EXPECT_EQ(reg.lookup_by_name("http")->dir, "/go/src/net/http");
  // Commands are not indexed by name.
  EXPECT_EQ(reg.lookup_by_name("main"), nullptr);
}

TEST(IndexPackageRegistry, LookupByPathPrefersLongestRoot)
{
  PackageRegistry reg;
  reg.insert(make_package("/ws", "src/x", "outer"));
  reg.insert(make_package("/ws/src", "x", "inner"));

  const auto pkg = reg.lookup_by_path("/ws/src/x");
  ASSERT_NE(pkg, nullptr);
  EXPECT_EQ(pkg->name, "inner");
}

TEST(IndexPackageRegistry, RenameUpdatesNameIndex)
{
  PackageRegistry reg;
  reg.insert(make_package("/go/src", "lib", "old"));
  reg.insert(make_package("/go/src", "lib", "fresh"));

  EXPECT_EQ(reg.size(), 1U);
  EXPECT_EQ(reg.lookup_by_name("old"), nullptr);
  ASSERT_NE(reg.lookup_by_name("fresh"), nullptr);

  const auto names = reg.name_index();
  ASSERT_EQ(names.size(), 1U);
  EXPECT_EQ(names.at("fresh"), "/go/src/lib");
}

TEST(IndexPackageRegistry, NameCollisionKeepsLatest)
{
  PackageRegistry reg;
  reg.insert(make_package("/go/src", "a/util", "util"));
  reg.insert(make_package("/go/src", "b/util", "util"));
  EXPECT_EQ(reg.lookup_by_name("util")->dir, "/go/src/b/util");

  // Removing the package the name does not point at leaves the entry.
  reg.remove("/go/src", "a/util");
  ASSERT_NE(reg.lookup_by_name("util"), nullptr);

  reg.remove("/go/src", "b/util");
  EXPECT_EQ(reg.lookup_by_name("util"), nullptr);
  EXPECT_EQ(reg.size(), 0U);
  EXPECT_TRUE(reg.roots().empty());
}

TEST(IndexPackageRegistry, RemoveByDirAndRoot)
{
  PackageRegistry reg;
  reg.insert(make_package("/go/src", "x", "x"));
  reg.insert(make_package("/go/src", "y", "y"));
  reg.insert(make_package("/home/go/src", "z", "z"));

  const std::vector<std::string> roots = {"/go/src", "/home/go/src"};
  EXPECT_EQ(reg.roots(), roots);

  const auto removed = reg.remove_by_dir("/go/src/x");
  ASSERT_NE(removed, nullptr);
  EXPECT_EQ(removed->name, "x");
  EXPECT_EQ(reg.remove_by_dir("/go/src/x"), nullptr);
  EXPECT_EQ(reg.lookup_by_name("x"), nullptr);

  const auto dropped = reg.remove_root("/home/go/src");
  ASSERT_EQ(dropped.size(), 1U);
  EXPECT_EQ(dropped[0]->name, "z");
  EXPECT_EQ(reg.lookup_by_name("z"), nullptr);
  EXPECT_EQ(reg.size(), 1U);
}

TEST(IndexPackageRegistry, PackagesSortedByDir)
{
  PackageRegistry reg;
  reg.insert(make_package("/b/src", "q", "q"));
  reg.insert(make_package("/a/src", "z", "z"));
  reg.insert(make_package("/a/src", "m", "m"));

  const auto pkgs = reg.packages();
  ASSERT_EQ(pkgs.size(), 3U);
  EXPECT_EQ(pkgs[0]->dir, "/a/src/m");
  EXPECT_EQ(pkgs[1]->dir, "/a/src/z");
  EXPECT_EQ(pkgs[2]->dir, "/b/src/q");
}

TEST(IndexPackageRegistry, InvalidateEnvironmentRepublishesCopies)
{
  PackageRegistry reg;
  auto pkg = std::make_shared<Package>(*make_package("/go/src", "x", "x"));
  pkg->classified_revision = 3;
  const PackagePtr published = pkg;
  reg.insert(published);

  reg.invalidate_environment();

  const auto now = reg.lookup("/go/src", "x");
  ASSERT_NE(now, nullptr);
  EXPECT_NE(now.get(), published.get());
  EXPECT_EQ(now->classified_revision, 0U);
  // The old snapshot is untouched.
  EXPECT_EQ(published->classified_revision, 3U);
  EXPECT_EQ(*now, *published);
}
