// BlobReaderTests.cpp - primitive cursor and blob heap

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Metadata/BlobHeap.hpp>
#include <NGIN/Metadata/BlobReader.hpp>

#include <array>
#include <vector>

using namespace NGIN::Metadata;

TEST_CASE("ReadsLittleEndianIntegers", "[metadata][BlobReader]")
{
  const std::array<NGIN::UInt8, 15> bytes{0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF, 0xEF, 0xCD, 0xAB, 0x89, 0x67, 0x45,
                                          0x23, 0x01};
  BlobReader r{bytes};

  CHECK(r.ReadUInt16().value() == 0x1234);
  CHECK(r.ReadUInt32().value() == 0x12345678u);
  CHECK(r.ReadSByte().value() == -1);
  CHECK(r.ReadUInt64().value() == 0x0123456789ABCDEFull);
  CHECK(r.AtEnd());
  CHECK(r.Position() == 15);
}

TEST_CASE("ReadsSignedAndFloatingPoint", "[metadata][BlobReader]")
{
  // -2 (int16), -42 (int32), 1.5f, -0.25
  const std::array<NGIN::UInt8, 18> bytes{0xFE, 0xFF, 0xD6, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0xC0,
                                          0x3F, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xD0, 0xBF};
  BlobReader r{bytes};
  CHECK(r.ReadInt16().value() == -2);
  CHECK(r.ReadInt32().value() == -42);
  CHECK(r.ReadSingle().value() == 1.5f);
  CHECK(r.ReadDouble().value() == -0.25);
  CHECK(r.Remaining() == 0);
}

TEST_CASE("ReadPastEndFailsWithoutMoving", "[metadata][BlobReader]")
{
  const std::array<NGIN::UInt8, 3> bytes{0x01, 0x02, 0x03};
  BlobReader r{bytes};
  REQUIRE(r.ReadByte().has_value());

  auto v = r.ReadUInt32();
  REQUIRE_FALSE(v.has_value());
  CHECK(v.error().code == ErrorCode::IoFault);
  CHECK(v.error().position == 1);
  CHECK(r.Position() == 1);

  auto b = r.ReadBytes(3);
  CHECK_FALSE(b.has_value());
  CHECK(r.ReadUInt16().value() == 0x0302);
  CHECK_FALSE(r.ReadByte().has_value());
}

TEST_CASE("CompressedUnsignedIntegers", "[metadata][BlobReader]")
{
  SECTION("one byte")
  {
    const std::array<NGIN::UInt8, 2> bytes{0x03, 0x7F};
    BlobReader r{bytes};
    CHECK(r.ReadCompressedUInt32().value() == 0x03);
    CHECK(r.ReadCompressedUInt32().value() == 0x7F);
  }
  SECTION("two bytes")
  {
    const std::array<NGIN::UInt8, 4> bytes{0x80, 0x80, 0xBF, 0xFF};
    BlobReader r{bytes};
    CHECK(r.ReadCompressedUInt32().value() == 0x80);
    CHECK(r.ReadCompressedUInt32().value() == 0x3FFF);
  }
  SECTION("four bytes")
  {
    const std::array<NGIN::UInt8, 4> bytes{0xC0, 0x00, 0x40, 0x00};
    BlobReader r{bytes};
    CHECK(r.ReadCompressedUInt32().value() == 0x4000);
    CHECK(r.AtEnd());
  }
  SECTION("invalid lead byte")
  {
    const std::array<NGIN::UInt8, 4> bytes{0xE0, 0x00, 0x00, 0x00};
    BlobReader r{bytes};
    auto v = r.ReadCompressedUInt32();
    REQUIRE_FALSE(v.has_value());
    CHECK(v.error().code == ErrorCode::IoFault);
    CHECK(r.Position() == 0);
  }
  SECTION("truncated")
  {
    const std::array<NGIN::UInt8, 2> bytes{0xC0, 0x00};
    BlobReader r{bytes};
    CHECK_FALSE(r.ReadCompressedUInt32().has_value());
    CHECK(r.Position() == 0);
  }
}

TEST_CASE("RewindAndReadAllBytes", "[metadata][BlobReader]")
{
  const std::array<NGIN::UInt8, 4> bytes{0xAA, 0xBB, 0xCC, 0xDD};
  BlobReader r{bytes};
  REQUIRE(r.ReadUInt16().has_value());
  REQUIRE(r.Rewind(1).has_value());
  CHECK(r.ReadByte().value() == 0xBB);
  CHECK_FALSE(r.Rewind(5).has_value());
  CHECK_FALSE(r.SetPosition(5).has_value());
  REQUIRE(r.SetPosition(4).has_value());
  CHECK(r.AtEnd());

  auto all = r.ReadAllBytes();
  REQUIRE(all.Size() == 4);
  CHECK(all[0] == 0xAA);
  CHECK(all[3] == 0xDD);
}

TEST_CASE("BlobHeapHandsOutIndependentReaders", "[metadata][BlobHeap]")
{
  BlobHeap heap;
  const std::vector<NGIN::UInt8> first{0x01, 0x00, 0x2A, 0x00, 0x00, 0x00};
  const std::vector<NGIN::UInt8> second(200, 0x11);
  const auto a = heap.Append(first);
  const auto b = heap.Append(second);
  CHECK(a == 0);
  CHECK(b == 7);

  auto ra = heap.CreateReader(a);
  auto rb = heap.CreateReader(b);
  REQUIRE(ra.has_value());
  REQUIRE(rb.has_value());
  CHECK(ra->Length() == first.size());
  CHECK(rb->Length() == second.size());

  REQUIRE(ra->ReadUInt16().has_value());
  CHECK(ra->Position() == 2);
  CHECK(rb->Position() == 0);
}

TEST_CASE("BlobHeapRejectsBadOffsets", "[metadata][BlobHeap]")
{
  const std::vector<NGIN::UInt8> raw{0x05, 0x01, 0x00};
  BlobHeap heap{raw};

  auto outside = heap.CreateReader(10);
  REQUIRE_FALSE(outside.has_value());
  CHECK(outside.error().code == ErrorCode::IoFault);

  auto tooLong = heap.CreateReader(0);
  REQUIRE_FALSE(tooLong.has_value());
  CHECK(tooLong.error().code == ErrorCode::IoFault);

  auto empty = heap.CreateReader(2);
  REQUIRE(empty.has_value());
  CHECK(empty->Length() == 0);
}
