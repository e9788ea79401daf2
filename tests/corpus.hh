#pragma once

#include <string>

// Small weapon and rules corpus in the Red Alert layout, shared by the
// extraction tests
namespace corpus {

  inline const std::string WEAPONS =
    "^Cannon:\n"
    "\tReloadDelay: 50\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tSpread: 128\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 30\n"
    "\t\t\tWood: 75\n"
    "\t\t\tLight: 75\n"
    "\t\t\tHeavy: 115\n"
    "\t\t\tConcrete: 50\n"
    "\tWarhead@2Eff: CreateEffect\n"
    "\t\tExplosions: small_explosion\n"
    "25mm:\n"
    "\tInherits: ^Cannon\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tLight: 116\n"
    "90mm:\n"
    "\tInherits: ^Cannon\n"
    "120mm:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 60\n"
    "\t\t\tHeavy: 70\n"
    "MammothTusk:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 100\n"
    "M1Carbine:\n"
    "\tWarhead@0Smudge: LeaveSmudge\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 999\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 150\n"
    "\t\t\tWood: 10\n"
    "\t\t\tLight: 30\n"
    "\t\t\tHeavy: 10\n"
    "\t\t\tConcrete: 10\n"
    "M60mg:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 150\n"
    "\t\t\tHeavy: 25\n"
    "Dragon:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 10\n"
    "\t\t\tLight: 100\n"
    "\t\t\tHeavy: 100\n"
    "RedEye:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 0\n"
    "\t\t\tLight: 100\n"
    "\t\t\tHeavy: 0\n"
    "Flamer:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tSpread: 213\n"
    "Sloppy:\n"
    "\twarhead@2: TargetDamage\n"
    "\t\tversus:\n"
    "\t\t\tNONE: 40\n"
    "\t\t\tHeavy: lots\n"
    "\t\t\tLight: 12.5\n"
    "\t\t\tShip: 200\n"
    "Skipper:\n"
    "\tWarhead@1Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tWater: 50\n"
    "\tWarhead@2Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tHeavy: 40\n"
    "\tWarhead@3Dam: SpreadDamage\n"
    "\t\tVersus:\n"
    "\t\t\tNone: 5\n";

  inline const std::string RULES =
    "^Infantry:\n"
    "\tArmor:\n"
    "\t\tType: None\n"
    "\tValued:\n"
    "\t\tCost: 100\n"
    "E1:\n"
    "\tInherits: ^Infantry\n"
    "\tArmament:\n"
    "\t\tWeapon: M1Carbine\n"
    "E3:\n"
    "\tInherits: ^Infantry\n"
    "\tValued:\n"
    "\t\tCost: 300\n"
    "\tArmament@PRIMARY:\n"
    "\t\tWeapon: RedEye\n"
    "\tArmament@SECONDARY:\n"
    "\t\tWeapon: Dragon\n"
    "E6:\n"
    "\tInherits: ^Infantry\n"
    "\tValued:\n"
    "\t\tCost: 500\n"
    "E7:\n"
    "\tInherits: ^Infantry\n"
    "\tValued:\n"
    "\t\tCost: 1200\n"
    "\tArmament:\n"
    "\t\tWeapon: M1Carbine\n"
    "1TNK:\n"
    "\tArmor:\n"
    "\t\tType: Heavy\n"
    "\tValued:\n"
    "\t\tCost: 700\n"
    "\tArmament:\n"
    "\t\tWeapon: 25mm\n"
    "4TNK:\n"
    "\tArmor:\n"
    "\t\tType: Heavy\n"
    "\tValued:\n"
    "\t\tCost: 2000\n"
    "\tArmament@PRIMARY:\n"
    "\t\tWeapon: 120mm\n"
    "\tArmament@SECONDARY:\n"
    "\t\tWeapon: MammothTusk\n"
    "HARV:\n"
    "\tArmor:\n"
    "\t\tType: Heavy\n"
    "\tValued:\n"
    "\t\tCost: 1100\n"
    "FTRK:\n"
    "\tArmament@AG:\n"
    "\t\tWeapon: 25mm\n"
    "MRJ:\n"
    "\tArmament@PRIMARY:\n"
    "\tArmament:\n"
    "\t\tWeapon: 25mm\n"
    "DTRK:\n"
    "\tArmament:\n"
    "\t\tWeapon: MiniNuke\n"
    "\tValued:\n"
    "\t\tCost: -1500\n"
    "TRUK:\n"
    "\tArmament@SECONDARY:\n"
    "\t\tWeapon: M60mg\n"
    "\tValued:\n"
    "\t\tCost: lots\n"
    "POWR:\n"
    "\tArmor:\n"
    "\t\tType: Wood\n"
    "\tValued:\n"
    "\t\tCost: 300\n"
    "PBOX:\n"
    "\tArmor:\n"
    "\t\tType: Heavy\n"
    "\tValued:\n"
    "\t\tCost: 600\n"
    "FTUR:\n"
    "\tValued:\n"
    "\t\tCost: 600\n"
    "\tArmament@GARRISONED:\n"
    "\t\tWeapon: M60mg\n"
    "GUN:\n"
    "\tArmor:\n"
    "\t\tType: Heavy\n"
    "\tArmament:\n"
    "\t\tWeapon: 90mm\n"
    "SAM:\n"
    "\tArmament:\n"
    "\t\tWeapon: RedEye\n"
    "HULK:\n"
    "\tInherits: ^Wreck\n";

} // namespace corpus
