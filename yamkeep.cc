#include "yamkeep.hh"

#include <spdlog/cfg/env.h>

int main( int argc, char** argv ) {
  spdlog::cfg::load_env_levels();

  if ( argc > 2 ) {
    std::cerr << "usage: yamkeep [FILE]\n";
    return 2;
  }

  try {
    yamkeep::Document doc = ( argc == 2 )
      ? yamkeep::Document::load( argv[1] )
      : yamkeep::Document::from_stream( std::cin );
    std::cout << doc.to_text();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[yamkeep] error: " << ex.what() << "\n";
    return 1;
  }
}
