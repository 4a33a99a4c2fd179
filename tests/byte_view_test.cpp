#include "h1stream/io/byte_view.hpp"

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace h1stream;
using namespace h1stream::io;

TEST(ByteViewTest, DefaultIsEmpty) {
  ByteView v;
  EXPECT_TRUE(v.empty());
  EXPECT_EQ(v.size(), 0);
  EXPECT_EQ(v.data(), nullptr);
  EXPECT_EQ(v.as_string_view(), "");
}

TEST(ByteViewTest, CopyOfString) {
  auto v = ByteView::copy_of(std::string_view{"hello"});
  EXPECT_EQ(v.size(), 5);
  EXPECT_EQ(v[0], 'h');
  EXPECT_EQ(v[4], 'o');
  EXPECT_EQ(v.to_string(), "hello");
}

TEST(ByteViewTest, SliceSharesStorage) {
  auto v = test::view("GET / HTTP/1.1");
  auto method = v.slice(0, 3);
  EXPECT_EQ(method.as_string_view(), "GET");
  EXPECT_EQ(method.data(), v.data());
  EXPECT_EQ(v.use_count(), 2);
}

TEST(ByteViewTest, SliceIsClamped) {
  auto v = test::view("abcdef");
  EXPECT_EQ(v.slice(4, 100).as_string_view(), "ef");
  EXPECT_TRUE(v.slice(10, 20).empty());
  EXPECT_TRUE(v.slice(3, 3).empty());
  EXPECT_TRUE(v.slice(5, 2).empty());
}

TEST(ByteViewTest, NestedSlices) {
  auto v = test::view("0123456789");
  auto inner = v.slice(2, 8).slice(1, 4);
  EXPECT_EQ(inner.as_string_view(), "345");
}

TEST(ByteViewTest, Drop) {
  auto v = test::view("abc\r\nrest");
  EXPECT_EQ(v.drop(5).as_string_view(), "rest");
  EXPECT_TRUE(v.drop(9).empty());
}

TEST(ByteViewTest, SliceOutlivesOriginal) {
  ByteView slice;
  {
    auto v = test::view("keep me alive");
    slice = v.slice(5, 7);
  }
  EXPECT_EQ(slice.as_string_view(), "me");
  EXPECT_EQ(slice.use_count(), 1);
}

TEST(ByteViewTest, AppendCopiesOnlyRemainder) {
  auto v = test::view("consumed|pending");
  auto pending = v.drop(9);
  auto grown = pending.append(as_bytes("+more"));

  EXPECT_EQ(grown.as_string_view(), "pending+more");
  EXPECT_EQ(pending.as_string_view(), "pending");
  EXPECT_EQ(v.as_string_view(), "consumed|pending");
}

TEST(ByteViewTest, AppendToEmpty) {
  ByteView v;
  auto grown = v.append(as_bytes("abc"));
  EXPECT_EQ(grown.as_string_view(), "abc");
  EXPECT_EQ(v.append({}).size(), 0);
}

TEST(ByteViewTest, AdoptTakesVector) {
  std::vector<std::uint8_t> bytes{'x', 'y', 'z'};
  auto v = ByteView::adopt(std::move(bytes));
  EXPECT_EQ(v.to_string(), "xyz");
}
