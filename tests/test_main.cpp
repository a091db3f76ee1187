#include <gtest/gtest.h>

#include <iostream>

// Main function for the test executable
int main(int argc, char **argv) {
  std::cout << "Running DocQA Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // Every fixture builds its own in-memory corpus; no global setup required here
  int result = RUN_ALL_TESTS();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
