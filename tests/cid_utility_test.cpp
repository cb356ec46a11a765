#include "cid_utility.hpp"

#include <string>
#include <vector>

#include "test_support.hpp"

using ChunkDrive::CID::CIDUtility;
using ChunkDriveTest::Bytes;
using ChunkDriveTest::Check;

int main() {
  {
    // Well-known SHA-256 vectors
    if (!Check(CIDUtility::generateSHA256(std::vector<char>{}) ==
                   "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
               "empty digest")) {
      return 1;
    }
    if (!Check(CIDUtility::generateSHA256(Bytes("abc")) ==
                   "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
               "abc digest")) {
      return 1;
    }
  }

  {
    const auto data = ChunkDriveTest::RandomBytes(4096, 7);
    const std::string cid = CIDUtility::generateSHA256(data);
    if (!Check(cid == CIDUtility::generateSHA256(data.data(), data.size()), "pointer overload matches")) {
      return 1;
    }
    if (!Check(CIDUtility::isValidCID(cid), "digest is a valid cid")) {
      return 1;
    }
    if (!Check(CIDUtility::verify(data, cid), "verify accepts original bytes")) {
      return 1;
    }
    auto altered = data;
    altered[100] = static_cast<char>(altered[100] ^ 1);
    if (!Check(!CIDUtility::verify(altered, cid), "verify rejects altered bytes")) {
      return 1;
    }
  }

  {
    if (!Check(!CIDUtility::isValidCID("abc"), "short cid rejected")) {
      return 1;
    }
    if (!Check(!CIDUtility::isValidCID(std::string(64, 'G')), "non-hex cid rejected")) {
      return 1;
    }
    if (!Check(!CIDUtility::isValidCID(std::string(64, 'A')), "uppercase cid rejected")) {
      return 1;
    }
  }

  {
    const std::string a = CIDUtility::randomHex(16);
    const std::string b = CIDUtility::randomHex(16);
    if (!Check(a.size() == 32 && b.size() == 32, "random hex length")) {
      return 1;
    }
    if (!Check(a != b, "random hex differs between calls")) {
      return 1;
    }
  }

  return 0;
}
