#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <pdsl/support/exception.h>

int main(int argc, char **argv) {
#ifdef PDSL_HAS_CPPTRACE
  cpptrace::register_terminate_handler();
#endif

  // build new arg list
  std::vector<char*> args;
  for (int i=0; i<argc; i++)
      args.push_back(argv[i]);

  // add --gtest_catch_exceptions=0
  args.push_back((new std::string("--gtest_catch_exceptions=0"))->data());

  argc = args.size();
  argv = args.data();

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
