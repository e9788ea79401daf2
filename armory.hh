//  armory | Armament Rules Merger & Resolver
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the armory developers
#pragma once

// Standard library includes
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace armory {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Damage multipliers keyed by target armor tag (1.0 = normal damage)
  using Versus = fkyaml::ordered_map< std::string, double >;

namespace internal {

  // Constants defining the reserved syntax of definition files and the
  // trait names read during extraction. This block provides a single
  // location for easy editing.
  inline constexpr char INDENT = '\t';
  inline constexpr char COMMENT = '#';
  inline constexpr char KEY_SEPARATOR = ':';
  inline constexpr char REMOVAL_PREFIX = '-';

  inline const std::string INHERITS = "Inherits";

  inline const std::string WARHEAD = "warhead";
  inline const std::string VERSUS = "Versus";
  inline const std::string WEAPON = "Weapon";
  inline const std::string ARMAMENT = "Armament";
  inline const std::string ARMAMENT_PRIMARY = ARMAMENT + "@PRIMARY";
  inline const std::string ARMAMENT_SECONDARY = ARMAMENT + "@SECONDARY";
  inline const std::string ARMAMENT_AG = ARMAMENT + "@AG";
  inline const std::string ARMAMENT_GARRISONED = ARMAMENT + "@GARRISONED";
  inline const std::string VALUED = "Valued";
  inline const std::string COST = "Cost";
  inline const std::string ARMOR = "Armor";
  inline const std::string TYPE = "Type";

  // Section names of an overrides YAML document
  inline const std::string ARMOR_TYPES = "armor types";
  inline const std::string DEFAULT_UNIT_ARMOR = "default unit armor";
  inline const std::string DEFAULT_BUILDING_ARMOR = "default building armor";
  inline const std::string DAMAGE_WARHEADS = "damage warheads";
  inline const std::string UNITS = "units";
  inline const std::string BUILDINGS = "buildings";
  inline const std::string DEFENSES = "defenses";
  inline const std::string MANUAL_EFFECTIVENESS = "manual effectiveness";
  inline const std::string GROUND_WEAPONS = "ground weapons";
  inline const std::string DUAL_WEAPON_UNITS = "dual weapon units";
  inline const std::string DEFENSE_WEAPONS = "defense weapons";

} // namespace armory::internal

  // Role of a child key, decided once when the key enters a Node
  enum class KeyKind {
    Field, // Ordinary data
    Inherits, // Names a parent definition via the node value
    Removal // Deletes the key that follows the prefix from the merged result
  };

  KeyKind classify_key( const std::string& key );

  // Tree element of a definition document. Every node (the document root
  // included) may carry a scalar value and ordered, uniquely-keyed children
  // at the same time.
  struct Node {

    struct Child;

    // Scalar written after the key separator, e.g. "SpreadDamage"
    std::string value;

    // Direct children in authored order
    std::vector< Child > children;

    bool empty() const;
    bool contains( const std::string& key ) const;

    // Exact-key lookup. Returns nullptr when the key is absent.
    const Node* find( const std::string& key ) const;
    Node* find( const std::string& key );

    // Inserts a child, or replaces the node of an existing child with the
    // same key in place (authored position is kept). Returns the stored
    // node.
    Node& set( const std::string& key, Node child );
  };

  struct Node::Child {
    std::string key;
    KeyKind kind = KeyKind::Field;
    Node node;
  };

  Node make_node( std::string value );

  bool operator==( const Node& a, const Node& b );
  bool operator!=( const Node& a, const Node& b );

  // Renders a node's children back into tab-indented definition text
  std::string dump( const Node& node );
  std::ostream& operator<<( std::ostream& os, const Node& node );

  // Parse tab-indented definition text. The children of the returned root
  // node are the top-level definitions in file order.
  Node parse( const std::string& text );
  Node parse( std::istream& in );

  // Path-based navigation with a case-insensitive fallback at each step.
  // find_path() returns nullptr when the path cannot be followed,
  // get_child() returns an empty node and get_value() an empty string.
  const Node* find_child( const Node& node, const std::string& key );
  const Node* find_path( const Node& node,
    const std::vector< std::string >& path );
  const Node& get_child( const Node& node,
    const std::vector< std::string >& path );
  std::string get_value( const Node& node,
    const std::vector< std::string >& path );

  // Named top-level definitions gathered from one or more documents
  class Definitions {
  public:

    // Adds every top-level node of a parsed document. A name that is
    // already present is replaced wholesale by the newer definition (no
    // merge) and recorded in shadowed().
    void add( const Node& document );
    void add_text( const std::string& text );

    bool contains( const std::string& name ) const;
    const Node* find( const std::string& name ) const;
    std::size_t size() const;

    // Names in first-seen order
    const std::vector< std::string >& names() const;

    // Names replaced by a later document, in replacement order
    const std::vector< std::string >& shadowed() const;

  private:
    std::vector< std::string > names_;
    std::unordered_map< std::string, Node > nodes_;
    std::vector< std::string > shadowed_;
  };

  class Resolver {
  public:

    explicit Resolver( Definitions definitions );

    // Fully-merged, directive-free form of a definition. Unknown names
    // resolve to an empty node. A name reached again while it is still
    // being resolved (an inheritance cycle) yields its own raw node.
    // The returned reference stays valid for the lifetime of the Resolver.
    const Node& resolve( const std::string& name );

    // Resolve every definition, in first-seen order
    void resolve_all();

    bool contains( const std::string& name ) const;
    const Definitions& definitions() const;

    // Names at which the cycle fallback was taken
    const std::vector< std::string >& cycles() const;

    // (child, parent) pairs for inheritance directives naming unknown
    // definitions
    const std::vector< std::pair< std::string, std::string > >&
      missing_parents() const;

  private:

    Definitions definitions_;

    // Memoized results. Entries are never modified once stored.
    std::unordered_map< std::string, Node > cache_;

    // Definitions whose resolution is on the current call stack
    std::unordered_set< std::string > in_progress_;

    std::vector< std::string > cycles_;
    std::vector< std::pair< std::string, std::string > > missing_parents_;
  };

  // Curated tables consumed by the Extractor. These correct cases where the
  // raw rules misrepresent what a unit can actually target.
  struct Overrides {

    // Target armor tags, in the order used for every filled Versus
    std::vector< std::string > armor_types;

    // Armor tag used when a definition has no Armor trait
    std::string default_unit_armor;

    // Armor tag reported for unknown buildings by DamageMatrix queries
    std::string default_building_armor;

    // Warhead types that deal damage (matched as substrings)
    std::vector< std::string > damage_warheads;

    // Lowercase entity ids to include in the damage matrix
    std::vector< std::string > units;
    std::vector< std::string > buildings;
    std::vector< std::string > defenses;

    // Entity id -> complete Versus, bypassing weapon lookup
    fkyaml::ordered_map< std::string, Versus > manual_effectiveness;

    // Entity id -> weapon used instead of an anti-air-only primary
    fkyaml::ordered_map< std::string, std::string > ground_weapons;

    // Entities whose primary and secondary weapons are averaged
    std::unordered_set< std::string > dual_weapon_units;

    // Defense id -> weapon of its garrison
    fkyaml::ordered_map< std::string, std::string > defense_weapons;

    // Built-in tables for the Red Alert ruleset
    static Overrides red_alert();

    // Start from red_alert() and replace every section named in the
    // document. Throws std::runtime_error on malformed input.
    static Overrides from_yaml( const std::string& text );
    static Overrides from_yaml( std::istream& in );
  };

  // Derives armor class, cost and effectiveness from resolved definitions.
  // Never throws: missing data degrades to the documented defaults.
  class Extractor {
  public:

    // Both arguments must outlive the Extractor
    Extractor( const Overrides& overrides, Resolver& weapons );

    std::string armor_class( const Node& def ) const;
    int cost( const Node& def ) const;

    std::string primary_weapon( const Node& def ) const;
    std::string secondary_weapon( const Node& def ) const;

    // Versus table of the first damage warhead that has one, limited to
    // known armor tags. Empty when the weapon deals no typed damage.
    Versus extract_versus( const Node& weapon ) const;

    // Every armor tag in order, missing tags defaulting to 1.0
    Versus fill_versus( const Versus& partial ) const;

    // Empty result means the entity cannot attack
    Versus unit_effectiveness( const std::string& id, const Node& def );
    Versus defense_effectiveness( const std::string& id, const Node& def );

  private:
    Versus weapon_versus( const std::string& weapon_name );

    const Overrides& overrides_;
    Resolver& weapons_;
  };

  // Per-entity attribute tables, in the order the ids were listed
  struct AttributeTables {
    fkyaml::ordered_map< std::string, std::string > armor;
    fkyaml::ordered_map< std::string, int > cost;
    fkyaml::ordered_map< std::string, Versus > effectiveness;
  };

  class DamageMatrix {
  public:

    // Resolve every entity of interest named by the overrides. Entities
    // absent from the rules, or resolving to an empty definition, are
    // skipped and listed in missing().
    static DamageMatrix build( Resolver& rules, Resolver& weapons,
      const Overrides& overrides );

    const AttributeTables& units() const;

    // Armor and cost of every building, effectiveness of the defenses
    const AttributeTables& buildings() const;

    const std::vector< std::string >& missing() const;

    // Damage multiplier of an attacker against an armor tag. 0.0 when the
    // attacker cannot attack or is unknown, 1.0 for an armor tag its
    // weapon has no modifier for.
    double effectiveness( const std::string& attacker,
      const std::string& target_armor ) const;
    double unit_vs_unit( const std::string& attacker,
      const std::string& target ) const;

    std::string unit_armor( const std::string& unit ) const;
    std::string building_armor( const std::string& building ) const;
    int unit_cost( const std::string& unit ) const;
    int building_cost( const std::string& building ) const;

    bool can_attack( const std::string& unit ) const;
    std::vector< std::string > non_combat_units() const;

  private:
    AttributeTables units_;
    AttributeTables buildings_;
    std::string default_unit_armor_;
    std::string default_building_armor_;
    std::vector< std::string > missing_;
  };

namespace internal {

  inline std::string trim( const std::string& s ) {
    const char* ws = " \t\r\n\f\v";
    const std::size_t first = s.find_first_not_of( ws );
    if ( first == std::string::npos ) return std::string();
    const std::size_t last = s.find_last_not_of( ws );
    return s.substr( first, last - first + 1 );
  }

  inline std::string to_lower( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::tolower(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline std::string to_upper( std::string s ) {
    for ( char& c : s ) {
      c = static_cast< char >( std::toupper(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline bool iequals( const std::string& a, const std::string& b ) {
    if ( a.size() != b.size() ) return false;
    for ( std::size_t i = 0; i < a.size(); ++i ) {
      if ( std::tolower(static_cast< unsigned char >(a[i]))
        != std::tolower(static_cast< unsigned char >(b[i])) ) return false;
    }
    return true;
  }

  inline const Node& empty_node() {
    static const Node empty;
    return empty;
  }

  // Parse a plain non-negative decimal integer ("+" and leading zeros
  // allowed). Anything else, overflow included, yields std::nullopt.
  inline std::optional< int > parse_non_negative_int( const std::string& s ) {
    std::string t = trim( s );
    if ( !t.empty() && t[0] == '+' ) t.erase( 0, 1 );
    if ( t.empty() ) return std::nullopt;
    for ( char c : t ) {
      if ( !std::isdigit(static_cast< unsigned char >(c)) ) return std::nullopt;
    }

    const std::size_t first = t.find_first_not_of( '0' );
    t = ( first == std::string::npos ) ? std::string( "0" ) : t.substr( first );
    if ( t.size() > 9 ) return std::nullopt;

    int out = 0;
    for ( char c : t ) out = out * 10 + ( c - '0' );
    return out;
  }

  // Round to two decimals from the exact binary value, exact ties going to
  // the even digit (0.625 -> 0.62)
  inline double round_to_hundredths( double x ) {
    char buf[ 64 ];
    std::snprintf( buf, sizeof(buf), "%.2f", x );
    return std::strtod( buf, nullptr );
  }

  inline double versus_at( const Versus& vs, const std::string& tag,
    double fallback )
  {
    auto it = vs.find( tag );
    return ( it == vs.end() ) ? fallback : it->second;
  }

  // Deep merge of a source node onto a target node, source wins. The
  // source value always replaces the target value. Children missing from
  // the target are copied in whole, so the target never refers to storage
  // owned by the source. Inheritance directives are not carried over.
  inline void deep_merge( Node& target, const Node& source ) {
    target.value = source.value;
    for ( const auto& child : source.children ) {
      if ( child.kind == KeyKind::Inherits ) continue;
      if ( Node* existing = target.find(child.key) ) {
        deep_merge( *existing, child.node );
      }
      else {
        target.set( child.key, child.node );
      }
    }
  }

  // Apply removal directives at every level: drop each key named by a
  // directive together with the directive itself
  inline void apply_removals( Node& node ) {
    std::unordered_set< std::string > targets;
    for ( const auto& child : node.children ) {
      if ( child.kind == KeyKind::Removal ) {
        targets.insert( child.key.substr(1) );
      }
    }

    if ( !targets.empty() ) {
      std::vector< Node::Child > kept;
      kept.reserve( node.children.size() );
      for ( auto& child : node.children ) {
        if ( child.kind == KeyKind::Removal ) continue;
        if ( targets.count(child.key) ) continue;
        kept.push_back( std::move(child) );
      }
      node.children = std::move( kept );
    }

    for ( auto& child : node.children ) apply_removals( child.node );
  }

  // Drop inheritance directives that were copied in as part of a subtree
  inline void strip_inherits( Node& node ) {
    std::vector< Node::Child > kept;
    kept.reserve( node.children.size() );
    for ( auto& child : node.children ) {
      if ( child.kind == KeyKind::Inherits ) continue;
      strip_inherits( child.node );
      kept.push_back( std::move(child) );
    }
    node.children = std::move( kept );
  }

  inline void dump_children( std::ostream& os, const Node& node,
    std::size_t depth )
  {
    for ( const auto& child : node.children ) {
      os << std::string( depth, INDENT ) << child.key << KEY_SEPARATOR;
      if ( !child.node.value.empty() ) os << ' ' << child.node.value;
      os << '\n';
      dump_children( os, child.node, depth + 1 );
    }
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return n.get_value< std::string >();
    if ( n.is_integer() ) return std::to_string(
      n.get_value< std::int64_t >()
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      n.get_value< double >()
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  [[noreturn]] inline void throw_override_error( const std::string& section,
    const std::string& msg )
  {
    std::ostringstream oss;
    oss << "overrides: '" << section << "' " << msg;
    throw std::runtime_error( oss.str() );
  }

  inline std::string read_scalar( const ordered_node& n,
    const std::string& section )
  {
    if ( !n.is_scalar() || n.is_null() ) {
      throw_override_error( section, "must hold scalar entries" );
    }
    return to_string_any( n );
  }

  inline std::vector< std::string > read_string_list( const ordered_node& n,
    const std::string& section, bool lowercase )
  {
    if ( !n.is_sequence() ) throw_override_error( section,
      "must be a sequence" );
    std::vector< std::string > out;
    out.reserve( n.size() );
    for ( std::size_t i = 0; i < n.size(); ++i ) {
      std::string s = read_scalar( n.at(i), section );
      out.push_back( lowercase ? to_lower(s) : s );
    }
    return out;
  }

  // Entity ids are lowercased, weapon names are kept as written
  inline fkyaml::ordered_map< std::string, std::string > read_weapon_map(
    const ordered_node& n, const std::string& section )
  {
    if ( !n.is_mapping() ) throw_override_error( section,
      "must be a mapping" );
    fkyaml::ordered_map< std::string, std::string > out;
    for ( const auto& [mk, mv] : n.map_items() ) {
      out[ to_lower(read_scalar(mk, section)) ] = read_scalar( mv, section );
    }
    return out;
  }

  inline double read_multiplier( const ordered_node& n,
    const std::string& section )
  {
    if ( n.is_integer() ) return static_cast< double >(
      n.get_value< std::int64_t >()
    );
    if ( n.is_float_number() ) return n.get_value< double >();
    throw_override_error( section, "multipliers must be numbers" );
  }

  inline fkyaml::ordered_map< std::string, Versus > read_versus_map(
    const ordered_node& n, const std::string& section )
  {
    if ( !n.is_mapping() ) throw_override_error( section,
      "must be a mapping" );
    fkyaml::ordered_map< std::string, Versus > out;
    for ( const auto& [mk, mv] : n.map_items() ) {
      const std::string id = to_lower( read_scalar(mk, section) );
      if ( !mv.is_mapping() ) throw_override_error( section,
        "entry '" + id + "' must map armor tags to multipliers" );
      Versus vs;
      for ( const auto& [tk, tv] : mv.map_items() ) {
        vs[ to_lower(read_scalar(tk, section)) ]
          = read_multiplier( tv, section );
      }
      out.emplace( id, vs );
    }
    return out;
  }

} // namespace armory::internal

} // namespace armory

inline armory::KeyKind armory::classify_key( const std::string& key ) {
  if ( key.rfind(internal::INHERITS, 0) == 0 ) return KeyKind::Inherits;
  if ( !key.empty() && key[0] == internal::REMOVAL_PREFIX ) {
    return KeyKind::Removal;
  }
  return KeyKind::Field;
}

inline bool armory::Node::empty() const {
  return value.empty() && children.empty();
}

inline bool armory::Node::contains( const std::string& key ) const {
  return this->find( key ) != nullptr;
}

inline const armory::Node* armory::Node::find( const std::string& key ) const
{
  for ( const auto& child : children ) {
    if ( child.key == key ) return &child.node;
  }
  return nullptr;
}

inline armory::Node* armory::Node::find( const std::string& key ) {
  for ( auto& child : children ) {
    if ( child.key == key ) return &child.node;
  }
  return nullptr;
}

inline armory::Node& armory::Node::set( const std::string& key, Node child ) {
  if ( Node* existing = this->find(key) ) {
    *existing = std::move( child );
    return *existing;
  }
  children.push_back( Child{ key, classify_key(key), std::move(child) } );
  return children.back().node;
}

inline armory::Node armory::make_node( std::string value ) {
  Node n;
  n.value = std::move( value );
  return n;
}

inline bool armory::operator==( const Node& a, const Node& b ) {
  if ( a.value != b.value ) return false;
  if ( a.children.size() != b.children.size() ) return false;
  for ( std::size_t i = 0; i < a.children.size(); ++i ) {
    const Node::Child& ca = a.children[ i ];
    const Node::Child& cb = b.children[ i ];
    if ( ca.key != cb.key || ca.kind != cb.kind ) return false;
    if ( ca.node != cb.node ) return false;
  }
  return true;
}

inline bool armory::operator!=( const Node& a, const Node& b ) {
  return !( a == b );
}

inline std::string armory::dump( const Node& node ) {
  std::ostringstream oss;
  internal::dump_children( oss, node, 0 );
  return oss.str();
}

inline std::ostream& armory::operator<<( std::ostream& os, const Node& node )
{
  return os << dump( node );
}

// Read from an input stream until end-of-file, then parse the resulting
// string
inline armory::Node armory::parse( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse( ss.str() );
}

// Each line is "key: value" (or a bare key) indented by some number of tabs.
// A line's parent is the nearest preceding line with a smaller tab count.
// Jumps of more than one tab are accepted as-is.
inline armory::Node armory::parse( const std::string& text ) {
  using internal::COMMENT;
  using internal::INDENT;
  using internal::KEY_SEPARATOR;

  Node root;

  // (depth, node) for the current chain of open ancestors. The root sits
  // below every real depth and is never popped. Only children of the
  // stack top are ever added, so the stored pointers stay valid.
  std::vector< std::pair< long, Node* > > stack;
  stack.emplace_back( -1, &root );

  std::istringstream lines( text );
  std::string line;
  while ( std::getline(lines, line) ) {
    const std::size_t depth = line.find_first_not_of( INDENT );
    if ( depth == std::string::npos ) continue;

    const std::string body = internal::trim( line.substr(depth) );
    if ( body.empty() || body[0] == COMMENT ) continue;

    std::string key;
    std::string value;
    const std::size_t sep = body.find( KEY_SEPARATOR );
    if ( sep == std::string::npos ) {
      key = body;
    }
    else {
      key = internal::trim( body.substr(0, sep) );
      value = internal::trim( body.substr(sep + 1) );
    }

    while ( stack.back().first >= static_cast< long >(depth) ) {
      stack.pop_back();
    }

    Node& child = stack.back().second->set( key, make_node(value) );
    stack.emplace_back( static_cast< long >(depth), &child );
  }

  return root;
}

inline const armory::Node* armory::find_child( const Node& node,
  const std::string& key )
{
  if ( const Node* exact = node.find(key) ) return exact;
  for ( const auto& child : node.children ) {
    if ( internal::iequals(child.key, key) ) return &child.node;
  }
  return nullptr;
}

inline const armory::Node* armory::find_path( const Node& node,
  const std::vector< std::string >& path )
{
  const Node* current = &node;
  for ( const auto& key : path ) {
    current = find_child( *current, key );
    if ( !current ) return nullptr;
  }
  return current;
}

inline const armory::Node& armory::get_child( const Node& node,
  const std::vector< std::string >& path )
{
  const Node* found = find_path( node, path );
  return found ? *found : internal::empty_node();
}

inline std::string armory::get_value( const Node& node,
  const std::vector< std::string >& path )
{
  const Node* found = find_path( node, path );
  return found ? found->value : std::string();
}

inline void armory::Definitions::add( const Node& document ) {
  for ( const auto& child : document.children ) {
    auto it = nodes_.find( child.key );
    if ( it != nodes_.end() ) {
      it->second = child.node;
      shadowed_.push_back( child.key );
    }
    else {
      nodes_.emplace( child.key, child.node );
      names_.push_back( child.key );
    }
  }
}

inline void armory::Definitions::add_text( const std::string& text ) {
  this->add( parse(text) );
}

inline bool armory::Definitions::contains( const std::string& name ) const {
  return nodes_.count( name ) > 0;
}

inline const armory::Node* armory::Definitions::find(
  const std::string& name ) const
{
  auto it = nodes_.find( name );
  return ( it == nodes_.end() ) ? nullptr : &it->second;
}

inline std::size_t armory::Definitions::size() const {
  return names_.size();
}

inline const std::vector< std::string >& armory::Definitions::names() const {
  return names_;
}

inline const std::vector< std::string >&
  armory::Definitions::shadowed() const
{
  return shadowed_;
}

inline armory::Resolver::Resolver( Definitions definitions )
  : definitions_( std::move(definitions) ) {}

inline const armory::Node& armory::Resolver::resolve( const std::string& name )
{
  // 1) Memoized
  auto cached = cache_.find( name );
  if ( cached != cache_.end() ) return cached->second;

  // 2) Unknown names are tolerated
  const Node* raw = definitions_.find( name );
  if ( !raw ) return internal::empty_node();

  // 3) Cycle: fall back to the unmerged definition to guarantee termination
  if ( in_progress_.count(name) ) {
    cycles_.push_back( name );
    return *raw;
  }

  in_progress_.insert( name );

  // 4) Parents in directive order (later parents win), then own fields.
  // Cache entries are stable under insertion, so a resolved parent can be
  // merged by reference.
  Node result;
  for ( const auto& child : raw->children ) {
    if ( child.kind != KeyKind::Inherits ) continue;
    const std::string& parent = child.node.value;
    if ( parent.empty() ) continue;
    if ( !definitions_.contains(parent) ) {
      missing_parents_.emplace_back( name, parent );
      continue;
    }
    internal::deep_merge( result, this->resolve(parent) );
  }
  internal::deep_merge( result, *raw );

  // 5) Removals apply after merging so they can target inherited fields
  internal::apply_removals( result );

  // 6) No directive survives into resolved output
  internal::strip_inherits( result );

  in_progress_.erase( name );
  return cache_.emplace( name, std::move(result) ).first->second;
}

inline void armory::Resolver::resolve_all() {
  for ( const auto& name : definitions_.names() ) this->resolve( name );
}

inline bool armory::Resolver::contains( const std::string& name ) const {
  return definitions_.contains( name );
}

inline const armory::Definitions& armory::Resolver::definitions() const {
  return definitions_;
}

inline const std::vector< std::string >& armory::Resolver::cycles() const {
  return cycles_;
}

inline const std::vector< std::pair< std::string, std::string > >&
  armory::Resolver::missing_parents() const
{
  return missing_parents_;
}

inline armory::Overrides armory::Overrides::red_alert() {
  Overrides ov;
  ov.armor_types = { "none", "light", "heavy", "wood", "concrete" };
  ov.default_unit_armor = "none";
  ov.default_building_armor = "wood";
  ov.damage_warheads = { "SpreadDamage", "TargetDamage" };

  ov.units = {
    // Infantry
    "e1", "e2", "e3", "e4", "e6", "e7", "medi", "mech", "spy", "thf",
    "shok", "dog",
    // Vehicles
    "1tnk", "2tnk", "3tnk", "4tnk", "v2rl", "jeep", "apc", "arty", "harv",
    "mcv", "ftrk", "mnly", "ttnk", "ctnk", "stnk", "qtnk", "dtrk", "mgg",
    "mrj", "truk",
    // Aircraft
    "heli", "hind", "mh60", "tran", "yak", "mig",
    // Ships
    "ss", "dd", "ca", "pt", "lst", "msub"
  };
  ov.buildings = {
    "fact", "powr", "apwr", "barr", "tent", "proc", "weap", "dome", "fix",
    "atek", "stek", "hpad", "afld", "spen", "syrd", "silo", "kenn", "pbox",
    "hbox", "gun", "ftur", "tsla", "agun", "sam", "gap", "iron", "pdox",
    "mslo"
  };
  ov.defenses = { "pbox", "hbox", "gun", "ftur", "tsla", "agun", "sam" };

  // Targeting restrictions that the raw Versus values do not show
  ov.manual_effectiveness = {
    // Colt45 only targets infantry, C4 demolishes buildings
    { "e7", { {"none", 10.0}, {"light", 0.1}, {"heavy", 0.1},
      {"wood", 5.0}, {"concrete", 5.0} } },
    // SilencedPPK only targets infantry
    { "spy", { {"none", 0.1}, {"light", 0.01}, {"heavy", 0.01},
      {"wood", 0.01}, {"concrete", 0.01} } },
    // DogJaw only attacks infantry
    { "dog", { {"none", 5.0}, {"light", 0.0}, {"heavy", 0.0},
      {"wood", 0.0}, {"concrete", 0.0} } },
    // TorpTube only reaches water targets
    { "ss", { {"none", 0.0}, {"light", 0.75}, {"heavy", 1.0},
      {"wood", 0.75}, {"concrete", 5.0} } },
    // Anti-air defenses
    { "agun", { {"none", 0.0}, {"light", 1.0}, {"heavy", 0.0},
      {"wood", 0.0}, {"concrete", 0.0} } },
    { "sam", { {"none", 0.0}, {"light", 1.0}, {"heavy", 0.0},
      {"wood", 0.0}, {"concrete", 0.0} } }
  };

  ov.ground_weapons = {
    { "e3", "Dragon" }, // PRIMARY is RedEye
    { "heli", "HellfireAG" } // PRIMARY is HellfireAA
  };

  ov.dual_weapon_units = { "4tnk" };

  // Garrisoned pillboxes carry no Armament of their own
  ov.defense_weapons = {
    { "pbox", "M60mg" },
    { "hbox", "M60mg" }
  };

  return ov;
}

inline armory::Overrides armory::Overrides::from_yaml( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return from_yaml( ss.str() );
}

inline armory::Overrides armory::Overrides::from_yaml(
  const std::string& text )
{
  using namespace internal;

  Overrides ov = red_alert();
  if ( trim(text).empty() ) return ov;

  const ordered_node doc = ordered_node::deserialize( text );
  if ( doc.is_null() ) return ov;
  if ( !doc.is_mapping() ) {
    throw std::runtime_error( "overrides: document must be a mapping" );
  }

  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string section = read_scalar( mk, "<section name>" );

    if ( section == ARMOR_TYPES ) {
      ov.armor_types = read_string_list( mv, section, true );
    }
    else if ( section == DEFAULT_UNIT_ARMOR ) {
      ov.default_unit_armor = to_lower( read_scalar(mv, section) );
    }
    else if ( section == DEFAULT_BUILDING_ARMOR ) {
      ov.default_building_armor = to_lower( read_scalar(mv, section) );
    }
    else if ( section == DAMAGE_WARHEADS ) {
      ov.damage_warheads = read_string_list( mv, section, false );
    }
    else if ( section == UNITS ) {
      ov.units = read_string_list( mv, section, true );
    }
    else if ( section == BUILDINGS ) {
      ov.buildings = read_string_list( mv, section, true );
    }
    else if ( section == DEFENSES ) {
      ov.defenses = read_string_list( mv, section, true );
    }
    else if ( section == MANUAL_EFFECTIVENESS ) {
      ov.manual_effectiveness = read_versus_map( mv, section );
    }
    else if ( section == GROUND_WEAPONS ) {
      ov.ground_weapons = read_weapon_map( mv, section );
    }
    else if ( section == DUAL_WEAPON_UNITS ) {
      const std::vector< std::string > ids
        = read_string_list( mv, section, true );
      ov.dual_weapon_units = std::unordered_set< std::string >(
        ids.begin(), ids.end() );
    }
    else if ( section == DEFENSE_WEAPONS ) {
      ov.defense_weapons = read_weapon_map( mv, section );
    }
    else {
      throw std::runtime_error( "overrides: unknown section '"
        + section + "'" );
    }
  }

  return ov;
}

inline armory::Extractor::Extractor( const Overrides& overrides,
  Resolver& weapons ) : overrides_( overrides ), weapons_( weapons ) {}

inline std::string armory::Extractor::armor_class( const Node& def ) const {
  const std::string armor = get_value( def,
    { internal::ARMOR, internal::TYPE } );
  return armor.empty() ? overrides_.default_unit_armor
    : internal::to_lower( armor );
}

inline int armory::Extractor::cost( const Node& def ) const {
  const auto parsed = internal::parse_non_negative_int(
    get_value(def, { internal::VALUED, internal::COST }) );
  return parsed ? *parsed : 0;
}

// The first Armament slot present decides, even if it names no weapon.
// Only the secondary slot is skipped when its weapon is empty.
inline std::string armory::Extractor::primary_weapon( const Node& def ) const
{
  using namespace internal;
  for ( const std::string& slot : { ARMAMENT_PRIMARY, ARMAMENT, ARMAMENT_AG } )
  {
    if ( const Node* arm = find_child(def, slot) ) {
      return get_value( *arm, { WEAPON } );
    }
  }
  return this->secondary_weapon( def );
}

inline std::string armory::Extractor::secondary_weapon( const Node& def ) const
{
  return get_value( def,
    { internal::ARMAMENT_SECONDARY, internal::WEAPON } );
}

inline armory::Versus armory::Extractor::extract_versus(
  const Node& weapon ) const
{
  Versus versus;

  for ( const auto& child : weapon.children ) {
    const std::string key = internal::to_lower( child.key );
    if ( key.rfind(internal::WARHEAD, 0) != 0 ) continue;

    bool deals_damage = false;
    for ( const auto& type : overrides_.damage_warheads ) {
      if ( child.node.value.find(type) != std::string::npos ) {
        deals_damage = true;
        break;
      }
    }
    if ( !deals_damage ) continue;

    const Node* vs = find_child( child.node, internal::VERSUS );
    if ( !vs ) continue;

    for ( const auto& armor : overrides_.armor_types ) {
      for ( const auto& entry : vs->children ) {
        if ( !internal::iequals(entry.key, armor) ) continue;
        if ( auto pct = internal::parse_non_negative_int(entry.node.value) ) {
          versus[ armor ] = *pct / 100.0;
        }
      }
    }

    // The first warhead that yields any armor modifier is authoritative
    if ( !versus.empty() ) break;
  }

  return versus;
}

inline armory::Versus armory::Extractor::fill_versus(
  const Versus& partial ) const
{
  Versus filled;
  for ( const auto& armor : overrides_.armor_types ) {
    filled[ armor ] = internal::versus_at( partial, armor, 1.0 );
  }
  return filled;
}

inline armory::Versus armory::Extractor::weapon_versus(
  const std::string& weapon_name )
{
  if ( weapon_name.empty() || !weapons_.contains(weapon_name) ) {
    return Versus();
  }
  return this->extract_versus( weapons_.resolve(weapon_name) );
}

inline armory::Versus armory::Extractor::unit_effectiveness(
  const std::string& id, const Node& def )
{
  const std::string uid = internal::to_lower( id );

  // 1) Manual override bypasses weapon lookup entirely
  auto manual = overrides_.manual_effectiveness.find( uid );
  if ( manual != overrides_.manual_effectiveness.end() ) {
    return manual->second;
  }

  // 2) Ground weapon substitution for anti-air-only primaries
  auto ground = overrides_.ground_weapons.find( uid );
  const std::string weapon_name
    = ( ground != overrides_.ground_weapons.end() )
      ? ground->second : this->primary_weapon( def );

  const Versus primary = this->weapon_versus( weapon_name );
  if ( primary.empty() ) return Versus();

  // 3) Dual-weapon averaging over the union of armor tags
  if ( overrides_.dual_weapon_units.count(uid) ) {
    const Versus secondary = this->weapon_versus(
      this->secondary_weapon(def) );
    if ( !secondary.empty() ) {
      Versus combined;
      for ( const auto& [armor, p] : primary ) {
        const double s = internal::versus_at( secondary, armor, 1.0 );
        combined[ armor ] = internal::round_to_hundredths( (p + s) / 2.0 );
      }
      for ( const auto& [armor, s] : secondary ) {
        if ( combined.find(armor) != combined.end() ) continue;
        combined[ armor ] = internal::round_to_hundredths( (1.0 + s) / 2.0 );
      }
      return this->fill_versus( combined );
    }
  }

  // 4) Ordinary single-weapon extraction
  return this->fill_versus( primary );
}

inline armory::Versus armory::Extractor::defense_effectiveness(
  const std::string& id, const Node& def )
{
  const std::string did = internal::to_lower( id );

  auto manual = overrides_.manual_effectiveness.find( did );
  if ( manual != overrides_.manual_effectiveness.end() ) {
    return manual->second;
  }

  std::string weapon_name;
  auto garrison = overrides_.defense_weapons.find( did );
  if ( garrison != overrides_.defense_weapons.end() ) {
    weapon_name = garrison->second;
  }
  else {
    weapon_name = this->primary_weapon( def );
    if ( weapon_name.empty() ) {
      weapon_name = get_value( def,
        { internal::ARMAMENT_GARRISONED, internal::WEAPON } );
    }
  }

  const Versus vs = this->weapon_versus( weapon_name );
  return vs.empty() ? Versus() : this->fill_versus( vs );
}

inline armory::DamageMatrix armory::DamageMatrix::build( Resolver& rules,
  Resolver& weapons, const Overrides& overrides )
{
  DamageMatrix matrix;
  matrix.default_unit_armor_ = overrides.default_unit_armor;
  matrix.default_building_armor_ = overrides.default_building_armor;

  Extractor extractor( overrides, weapons );

  // Entity ids are lowercase, rules definitions are named in uppercase
  for ( const auto& uid : overrides.units ) {
    const Node& def = rules.resolve( internal::to_upper(uid) );
    if ( def.empty() ) {
      matrix.missing_.push_back( uid );
      continue;
    }
    matrix.units_.armor.emplace( uid, extractor.armor_class(def) );
    matrix.units_.cost.emplace( uid, extractor.cost(def) );
    matrix.units_.effectiveness.emplace( uid,
      extractor.unit_effectiveness(uid, def) );
  }

  for ( const auto& bid : overrides.buildings ) {
    const Node& def = rules.resolve( internal::to_upper(bid) );
    if ( def.empty() ) {
      matrix.missing_.push_back( bid );
      continue;
    }
    matrix.buildings_.armor.emplace( bid, extractor.armor_class(def) );
    matrix.buildings_.cost.emplace( bid, extractor.cost(def) );
  }

  for ( const auto& did : overrides.defenses ) {
    const Node& def = rules.resolve( internal::to_upper(did) );
    if ( def.empty() ) continue; // reported with the buildings
    matrix.buildings_.effectiveness.emplace( did,
      extractor.defense_effectiveness(did, def) );
  }

  return matrix;
}

inline const armory::AttributeTables& armory::DamageMatrix::units() const {
  return units_;
}

inline const armory::AttributeTables&
  armory::DamageMatrix::buildings() const
{
  return buildings_;
}

inline const std::vector< std::string >&
  armory::DamageMatrix::missing() const
{
  return missing_;
}

inline double armory::DamageMatrix::effectiveness(
  const std::string& attacker, const std::string& target_armor ) const
{
  const std::string id = internal::to_lower( attacker );
  auto it = units_.effectiveness.find( id );
  if ( it == units_.effectiveness.end() ) {
    it = buildings_.effectiveness.find( id );
    if ( it == buildings_.effectiveness.end() ) return 0.0;
  }
  if ( it->second.empty() ) return 0.0;
  return internal::versus_at( it->second, internal::to_lower(target_armor),
    1.0 );
}

inline double armory::DamageMatrix::unit_vs_unit(
  const std::string& attacker, const std::string& target ) const
{
  return this->effectiveness( attacker, this->unit_armor(target) );
}

inline std::string armory::DamageMatrix::unit_armor(
  const std::string& unit ) const
{
  auto it = units_.armor.find( internal::to_lower(unit) );
  return ( it == units_.armor.end() ) ? default_unit_armor_ : it->second;
}

inline std::string armory::DamageMatrix::building_armor(
  const std::string& building ) const
{
  auto it = buildings_.armor.find( internal::to_lower(building) );
  return ( it == buildings_.armor.end() ) ? default_building_armor_
    : it->second;
}

inline int armory::DamageMatrix::unit_cost( const std::string& unit ) const {
  auto it = units_.cost.find( internal::to_lower(unit) );
  return ( it == units_.cost.end() ) ? 0 : it->second;
}

inline int armory::DamageMatrix::building_cost(
  const std::string& building ) const
{
  auto it = buildings_.cost.find( internal::to_lower(building) );
  return ( it == buildings_.cost.end() ) ? 0 : it->second;
}

inline bool armory::DamageMatrix::can_attack( const std::string& unit ) const {
  auto it = units_.effectiveness.find( internal::to_lower(unit) );
  return it != units_.effectiveness.end() && !it->second.empty();
}

inline std::vector< std::string >
  armory::DamageMatrix::non_combat_units() const
{
  std::vector< std::string > out;
  for ( const auto& [id, vs] : units_.effectiveness ) {
    if ( vs.empty() ) out.push_back( id );
  }
  return out;
}
