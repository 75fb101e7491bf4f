#define CATCH_CONFIG_CONSOLE_WIDTH 300
#define CATCH_CONFIG_RUNNER
#include "catch2/catch_all.hpp"
#include "libmypv/logging.hpp"

int main( int argc, char* argv[] ) {

  mypv::Log::severity loglevel = mypv::Log::severity::error;
  bool disabled = false;
  if (const char* env_p = std::getenv("MYPV_TEST_LOGLEVEL")) {
      disabled = !mypv::Log::fromVerbosity(std::atoi(env_p), loglevel);
  }
  mypv::Log::init_logging(loglevel, disabled);

  int result = Catch::Session().run( argc, argv );

  return result;
}
