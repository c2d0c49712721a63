/**
 * @file test_atoms.cpp
 * @brief Unit tests for the atom registry
 */

#include "fake_transport.h"

#include <clipwatch/atoms.h>
#include <gtest/gtest.h>

using namespace clipwatch;
using namespace clipwatch::fake;

class AtomRegistryTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeDisplay> display = std::make_shared<FakeDisplay>();
  std::unique_ptr<ConnectionHandle> conn;

  void SetUp() override {
    auto opened = ConnectionHandle::open(make_fake_transport(display));
    ASSERT_TRUE(opened.is_ok());
    conn = std::move(opened).value();
  }
};

TEST_F(AtomRegistryTest, InternReturnsServerAtom) {
  AtomRegistry atoms(*conn);

  auto clipboard = atoms.intern(atom_names::kClipboard);
  ASSERT_TRUE(clipboard.is_ok());
  EXPECT_EQ(clipboard.value(), display->atom(atom_names::kClipboard));
  EXPECT_NE(clipboard.value(), kNone);
}

TEST_F(AtomRegistryTest, InternCachesByName) {
  AtomRegistry atoms(*conn);
  const int before = display->intern_calls;

  auto first = atoms.intern(atom_names::kTargets);
  auto second = atoms.intern(atom_names::kTargets);

  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(first.value(), second.value());
  EXPECT_EQ(display->intern_calls, before + 1);
  EXPECT_EQ(atoms.size(), 1u);
}

TEST_F(AtomRegistryTest, DistinctNamesGetDistinctAtoms) {
  AtomRegistry atoms(*conn);

  auto html = atoms.intern(atom_names::kHtml);
  auto utf8 = atoms.intern(atom_names::kUtf8String);

  ASSERT_TRUE(html.is_ok());
  ASSERT_TRUE(utf8.is_ok());
  EXPECT_NE(html.value(), utf8.value());
  EXPECT_EQ(atoms.size(), 2u);
}

TEST_F(AtomRegistryTest, InternFailureIsAtomInternFailed) {
  display->fail_intern.insert(atom_names::kIncr);
  AtomRegistry atoms(*conn);

  auto incr = atoms.intern(atom_names::kIncr);
  ASSERT_TRUE(incr.is_error());
  EXPECT_EQ(incr.error().code, ErrorCode::AtomInternFailed);
  EXPECT_FALSE(is_recoverable(incr.error().code));
  EXPECT_EQ(atoms.size(), 0u);
}

TEST_F(AtomRegistryTest, NameOfResolvesServerAtom) {
  AtomRegistry atoms(*conn);
  AtomId html = display->atom(atom_names::kHtml);

  auto name = atoms.name_of(html);
  ASSERT_TRUE(name.is_ok());
  EXPECT_EQ(name.value(), "text/html");
}

TEST_F(AtomRegistryTest, NameOfNoneIsInvalid) {
  AtomRegistry atoms(*conn);

  auto name = atoms.name_of(kNone);
  ASSERT_TRUE(name.is_error());
  EXPECT_EQ(name.error().code, ErrorCode::InvalidArgument);
}

TEST_F(AtomRegistryTest, NameOfUnknownAtomFails) {
  AtomRegistry atoms(*conn);

  auto name = atoms.name_of(99999);
  EXPECT_TRUE(name.is_error());
}
