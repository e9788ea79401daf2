//  armory | Armament Rules Merger & Resolver
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the armory developers
#include "armory.hh"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

  namespace fs = std::filesystem;

  // Rules files read from a mod directory, in load order (later files win)
  const std::vector< std::string > RULES_FILES = {
    "defaults.yaml", "infantry.yaml", "vehicles.yaml", "aircraft.yaml",
    "ships.yaml", "structures.yaml"
  };

  const char* USAGE =
    "usage: armory [--config FILE] [--dump NAME]\n"
    "              (--mod DIR | --weapons FILE... --rules FILE...)\n";

  struct Options {
    std::optional< std::string > config;
    std::optional< std::string > dump;
    std::vector< std::string > weapons;
    std::vector< std::string > rules;
    bool help = false;
  };

  void collect_mod_files( const fs::path& mod, Options& opts ) {
    const fs::path weapon_dir = mod / "weapons";
    if ( !fs::is_directory(weapon_dir) ) {
      throw std::runtime_error( "no weapons directory under '"
        + mod.string() + "'" );
    }
    std::vector< std::string > found;
    for ( const auto& entry : fs::directory_iterator(weapon_dir) ) {
      if ( entry.is_regular_file() && entry.path().extension() == ".yaml" ) {
        found.push_back( entry.path().string() );
      }
    }
    std::sort( found.begin(), found.end() );
    opts.weapons.insert( opts.weapons.end(), found.begin(), found.end() );

    for ( const auto& name : RULES_FILES ) {
      const fs::path p = mod / "rules" / name;
      if ( fs::exists(p) ) opts.rules.push_back( p.string() );
    }
  }

  Options parse_args( int argc, char** argv ) {
    Options opts;
    std::vector< std::string >* list = nullptr;

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      auto next = [&]() -> std::string {
        if ( i + 1 >= argc ) {
          throw std::runtime_error( "missing value after '" + arg + "'" );
        }
        return argv[ ++i ];
      };

      if ( arg == "-h" || arg == "--help" ) {
        opts.help = true;
        return opts;
      }
      else if ( arg == "--config" ) opts.config = next();
      else if ( arg == "--dump" ) opts.dump = next();
      else if ( arg == "--mod" ) collect_mod_files( next(), opts );
      else if ( arg == "--weapons" ) list = &opts.weapons;
      else if ( arg == "--rules" ) list = &opts.rules;
      else if ( !arg.empty() && arg[0] == '-' ) {
        throw std::runtime_error( "unknown option '" + arg + "'" );
      }
      else if ( list ) list->push_back( arg );
      else {
        throw std::runtime_error( "file '" + arg
          + "' given before --weapons or --rules" );
      }
    }

    if ( opts.weapons.empty() || opts.rules.empty() ) {
      throw std::runtime_error( "both weapons and rules files are required" );
    }
    return opts;
  }

  std::string read_file( const std::string& path ) {
    std::ifstream in( path );
    if ( !in ) throw std::runtime_error( "cannot read '" + path + "'" );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  armory::Definitions load_definitions( const std::vector< std::string >& files )
  {
    armory::Definitions defs;
    for ( const auto& path : files ) defs.add_text( read_file(path) );
    for ( const auto& name : defs.shadowed() ) {
      std::cerr << "[armory] warning: '" << name
        << "' redefined by a later file, earlier definition dropped\n";
    }
    return defs;
  }

  void report( const char* label, const armory::Resolver& resolver ) {
    for ( const auto& name : resolver.cycles() ) {
      std::cerr << "[armory] warning: " << label
        << " inheritance cycle broken at '" << name << "'\n";
    }
    for ( const auto& [child, parent] : resolver.missing_parents() ) {
      std::cerr << "[armory] warning: " << label << " '" << child
        << "' inherits unknown '" << parent << "'\n";
    }
  }

  armory::ordered_node versus_node( const armory::Versus& vs ) {
    armory::ordered_node n = armory::ordered_node::mapping();
    for ( const auto& [armor, mult] : vs ) {
      n[ armor ] = armory::internal::make_node_from( mult );
    }
    return n;
  }

  armory::ordered_node tables_node( const armory::AttributeTables& t ) {
    using armory::internal::make_node_from;
    armory::ordered_node armor = armory::ordered_node::mapping();
    for ( const auto& [id, tag] : t.armor ) armor[ id ] = make_node_from( tag );
    armory::ordered_node cost = armory::ordered_node::mapping();
    for ( const auto& [id, c] : t.cost ) {
      cost[ id ] = make_node_from( static_cast< std::int64_t >(c) );
    }
    armory::ordered_node eff = armory::ordered_node::mapping();
    for ( const auto& [id, vs] : t.effectiveness ) eff[ id ] = versus_node( vs );

    armory::ordered_node n = armory::ordered_node::mapping();
    n[ std::string("armor") ] = armor;
    n[ std::string("cost") ] = cost;
    n[ std::string("effectiveness") ] = eff;
    return n;
  }

} // namespace

int main( int argc, char** argv ) {
  try {
    const Options opts = parse_args( argc, argv );
    if ( opts.help ) {
      std::cout << USAGE;
      return 0;
    }

    armory::Overrides overrides = opts.config
      ? armory::Overrides::from_yaml( read_file(*opts.config) )
      : armory::Overrides::red_alert();

    armory::Resolver weapons( load_definitions(opts.weapons) );
    armory::Resolver rules( load_definitions(opts.rules) );
    std::cerr << "[armory] " << weapons.definitions().size()
      << " weapon definitions, " << rules.definitions().size()
      << " unit/building definitions\n";

    if ( opts.dump ) {
      std::cout << rules.resolve( *opts.dump );
      report( "rules", rules );
      return 0;
    }

    const armory::DamageMatrix matrix
      = armory::DamageMatrix::build( rules, weapons, overrides );

    report( "weapons", weapons );
    report( "rules", rules );
    for ( const auto& id : matrix.missing() ) {
      std::cerr << "[armory] warning: " << armory::internal::to_upper( id )
        << " not found in rules or empty\n";
    }

    armory::ordered_node out = armory::ordered_node::mapping();
    out[ std::string("units") ] = tables_node( matrix.units() );
    out[ std::string("buildings") ] = tables_node( matrix.buildings() );
    std::cout << armory::ordered_node::serialize( out );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[armory] error: " << ex.what() << "\n";
    std::cerr << USAGE;
    return 1;
  }
}
