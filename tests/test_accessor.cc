#include <gtest/gtest.h>
#include "armory.hh"

using namespace armory;

// ============================================================================
// Path navigation
// ============================================================================

class AccessorTest : public ::testing::Test {
protected:
  const Node doc_ = parse(
    "HIND:\n"
    "\tArmament@PRIMARY:\n"
    "\t\tWeapon: ChainGun\n"
    "\tarmor:\n"
    "\t\ttype: light\n"
    "\tValued:\n"
    "\t\tcost: 1200\n"
    "\t\tCost: 1350\n"
    "\tHealth: full\n" );
  const Node& hind_ = *doc_.find( "HIND" );
};

TEST_F(AccessorTest, ExactPath) {
  EXPECT_EQ( get_value(hind_, { "Armament@PRIMARY", "Weapon" }), "ChainGun" );
}

TEST_F(AccessorTest, CaseInsensitiveFallback) {
  EXPECT_EQ( get_value(hind_, { "Armor", "Type" }), "light" );
  EXPECT_EQ( get_value(hind_, { "armament@primary", "WEAPON" }), "ChainGun" );
}

TEST_F(AccessorTest, ExactMatchPreferredOverEarlierCaseVariant) {
  EXPECT_EQ( get_value(hind_, { "Valued", "Cost" }), "1350" );
  EXPECT_EQ( get_value(hind_, { "Valued", "cost" }), "1200" );
}

TEST_F(AccessorTest, FirstCaseInsensitiveMatchInChildOrder) {
  EXPECT_EQ( get_value(hind_, { "Valued", "COST" }), "1200" );
}

TEST_F(AccessorTest, MissingPathYieldsEmpty) {
  EXPECT_EQ( get_value(hind_, { "Armament@SECONDARY", "Weapon" }), "" );
  EXPECT_EQ( find_path(hind_, { "Armor", "Class" }), nullptr );
  EXPECT_TRUE( get_child(hind_, { "Nope" }).empty() );
}

TEST_F(AccessorTest, ValueAndSubNode) {
  EXPECT_EQ( get_value(hind_, { "Health" }), "full" );
  const Node& valued = get_child( hind_, { "valued" } );
  EXPECT_EQ( valued.children.size(), 2u );
}

TEST_F(AccessorTest, EmptyPathIsTheNodeItself) {
  EXPECT_EQ( find_path(hind_, {}), &hind_ );
  EXPECT_EQ( get_value(*hind_.find("Health"), {}), "full" );
}

TEST_F(AccessorTest, FindChildSingleStep) {
  const Node* arm = find_child( hind_, "ARMAMENT@primary" );
  ASSERT_NE( arm, nullptr );
  EXPECT_EQ( arm->find("Weapon")->value, "ChainGun" );
  EXPECT_EQ( find_child(hind_, "Armament"), nullptr );
}
