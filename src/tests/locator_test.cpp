#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "io/input_file.hpp"
#include "locator/locator.hpp"
#include "test_utils.hpp"

using namespace ecrs;

namespace {

// Computed independently from the recursive definition of the tree with OpenSSL
const char* const EMPTY_LOCATOR =
    "gnunet://fs/chk/"
    "PU1U2DBUTUSBRSAK518DCRC00VB21P051DBHBN43UIKI3KRCT774FK6H7HEOBSLGVU1HHKK7FRM2UOTP66UKEGBQG6IJGCJQV4JTKFG."
    "PU1U2DBUTUSBRSAK518DCRC00VB21P051DBHBN43UIKI3KRCT774FK6H7HEOBSLGVU1HHKK7FRM2UOTP66UKEGBQG6IJGCJQV4JTKFG."
    "0";

const char* const HELLO_LOCATOR =
    "gnunet://fs/chk/"
    "JDOT495TCBPNGNCMQHLD7QHTECOPNUU2H46ALMN2RVRIA6B77IJI68U3R6DQBG8TFHTCORGKN32TK326CD3LOBIS7BFF8RRJNJFC0GO."
    "S2JMKEB7LKP0T4PREQDRUV32R6Q1KOJGE9H5CBJ01KVT7QA19OLK5PSNSVG4PPNKP5SQG47J0R2J8DCS3NANOG045IR9P5RGIER3SLO."
    "5";

// make_pattern(70000): three leaves under one internal block
const char* const PATTERN_70000_LOCATOR =
    "gnunet://fs/chk/"
    "CKBRVL82OLP6SIPR8NV6OMUUKEJ3JRGGUV09LO2O58UV4GUB1KG1IN81OVIUO33KNBQOKH9OKUN3847D8PDVAHIEK4N82I7K2LTPHEO."
    "3LB5RNLGANO4T5TFGPQPT6I6GRITBPFP0C0K92JMRC0GTQ8535R4QDO0FLUUEV9SG0861NC106U1DNRLTNKI482VA6A56IAJ881IDFG."
    "70000";

// make_pattern(32768 * 256 + 1): depth three
const char* const PATTERN_DEPTH_THREE_LOCATOR =
    "gnunet://fs/chk/"
    "U2B6L13JTM0RG54PBTQI90HJP5GANCLD1H429S2OMVJDD5E29JQVEUA60RQMJ6RVFC8EM7HV8QB7DHR7IEVL6K2IB4RAPT16N93TB68."
    "G6UDG9S1LEN78EVIPP5D4AIGMFIHUOI51J7S3VN2SMPF5KUDJ3H2BTURADDB32K76G0C0ACSKRDJRSPEMVACD97H899LRCETR9HAGPO."
    "8388609";

std::string locator_of(const std::vector<uint8_t>& data) {
  std::stringstream input = make_stream(data);
  return locator::locator_for_stream(input, data.size());
}

} // namespace

class LocatorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("locator_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string write_file(const std::string& name, const std::vector<uint8_t>& data) {
    std::filesystem::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path.string();
  }
};

TEST_F(LocatorTest, EmptyInput) {
  const std::string result = locator_of({});
  EXPECT_EQ(result, EMPTY_LOCATOR);
  EXPECT_EQ(result.substr(result.size() - 2), ".0");
}

TEST_F(LocatorTest, KnownVectors) {
  EXPECT_EQ(locator_of({'h', 'e', 'l', 'l', 'o'}), HELLO_LOCATOR);
  EXPECT_EQ(locator_of(make_pattern(70000)), PATTERN_70000_LOCATOR);
  EXPECT_EQ(locator_of(make_pattern(32768 * 256 + 1)), PATTERN_DEPTH_THREE_LOCATOR);
}

TEST_F(LocatorTest, SizeFieldForFullLeaf) {
  const std::string result = locator_of(make_pattern(32768));
  EXPECT_EQ(result.substr(result.rfind('.') + 1), "32768");
  EXPECT_EQ(result.size(), std::string("gnunet://fs/chk/").size() + 103 + 1 + 103 + 1 + 5);
}

TEST_F(LocatorTest, FormatAndParseAgree) {
  const tree::FileIdentifier parsed = locator::parse(PATTERN_70000_LOCATOR);
  EXPECT_EQ(parsed.file_length, 70000u);
  EXPECT_EQ(locator::format(parsed), PATTERN_70000_LOCATOR);
}

TEST_F(LocatorTest, ParseRejectsMalformedLocators) {
  const std::string valid = HELLO_LOCATOR;
  const std::string body = valid.substr(std::string("gnunet://fs/chk/").size());

  EXPECT_THROW(locator::parse(""), locator::LocatorError);
  EXPECT_THROW(locator::parse("gnunet://fs/sks/" + body), locator::LocatorError);
  EXPECT_THROW(locator::parse("gnunet://fs/chk/" + body.substr(1)), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid + ".7"), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid.substr(0, valid.rfind('.'))), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid.substr(0, valid.rfind('.') + 1)), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid.substr(0, valid.rfind('.') + 1) + "-5"), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid.substr(0, valid.rfind('.') + 1) + "05"), locator::LocatorError);
  EXPECT_THROW(locator::parse(valid.substr(0, valid.rfind('.') + 1) + "18446744073709551616"),
               locator::LocatorError);

  std::string lowercase = valid;
  lowercase[20] = 'a';
  EXPECT_THROW(locator::parse(lowercase), locator::LocatorError);
}

TEST_F(LocatorTest, ParseAcceptsLargestSize) {
  const std::string valid = HELLO_LOCATOR;
  const std::string max_size = valid.substr(0, valid.rfind('.') + 1) + "18446744073709551615";
  EXPECT_EQ(locator::parse(max_size).file_length, UINT64_MAX);
}

TEST_F(LocatorTest, LocatorForFile) {
  const std::string path = write_file("hello.txt", {'h', 'e', 'l', 'l', 'o'});
  EXPECT_EQ(locator::locator_for_file(path), HELLO_LOCATOR);

  const std::string empty_path = write_file("empty.bin", {});
  EXPECT_EQ(locator::locator_for_file(empty_path), EMPTY_LOCATOR);
}

TEST_F(LocatorTest, LocatorForFileReportsBlocks) {
  const std::string path = write_file("pattern.bin", make_pattern(70000));
  size_t dblocks = 0;
  size_t iblocks = 0;
  const std::string result = locator::locator_for_file(path, [&](const tree::BlockEvent& event) {
    (event.type == tree::BlockType::DBlock ? dblocks : iblocks)++;
  });
  EXPECT_EQ(result, PATTERN_70000_LOCATOR);
  EXPECT_EQ(dblocks, 3u);
  EXPECT_EQ(iblocks, 1u);
}

TEST_F(LocatorTest, MissingFileFails) {
  EXPECT_THROW(locator::locator_for_file((test_dir / "missing.bin").string()), io::IoError);
  EXPECT_THROW(locator::locator_for_file(test_dir.string()), io::IoError);
}
