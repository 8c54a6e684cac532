#include "minitest.hpp"
#include "util/Plist.hpp"
#include <string>
#include <vector>

static std::vector<unsigned char> bytes(const std::string& s) {
  return std::vector<unsigned char>(s.begin(), s.end());
}

TEST(plist_xml_top_level_strings) {
  auto data = bytes(
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n"
    "<dict>\n"
    "  <key>CFBundleIdentifier</key>\n"
    "  <string>com.example.Editor</string>\n"
    "  <key>CFBundleName</key>\n"
    "  <string>Tom &amp; Jerry</string>\n"
    "  <key>LSRequiresNativeExecution</key>\n"
    "  <true/>\n"
    "  <key>CFBundleDocumentTypes</key>\n"
    "  <array>\n"
    "    <dict>\n"
    "      <key>CFBundleTypeName</key>\n"
    "      <string>Nested</string>\n"
    "    </dict>\n"
    "  </array>\n"
    "  <key>CFBundleShortVersionString</key>\n"
    "  <string>2.1</string>\n"
    "  <key>Empty</key>\n"
    "  <string/>\n"
    "</dict>\n"
    "</plist>\n");
  auto p = harbor::util::parse_plist_strings(data);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->at("CFBundleIdentifier"), "com.example.Editor");
  ASSERT_EQ(p->at("CFBundleName"), "Tom & Jerry");
  ASSERT_EQ(p->at("CFBundleShortVersionString"), "2.1");
  ASSERT_EQ(p->at("Empty"), "");
  ASSERT_TRUE(p->find("LSRequiresNativeExecution") == p->end());
  ASSERT_TRUE(p->find("CFBundleTypeName") == p->end());
}

TEST(plist_xml_bools_and_string_arrays) {
  auto data = bytes(
    "<plist version=\"1.0\">\n<dict>\n"
    "  <key>Label</key><string>com.example.agent</string>\n"
    "  <key>ProgramArguments</key>\n"
    "  <array>\n    <string>/bin/zsh</string>\n    <string>-c</string>\n"
    "    <dict><key>x</key><string>nested</string></dict>\n  </array>\n"
    "  <key>RunAtLoad</key><true/>\n"
    "  <key>Disabled</key><false/>\n"
    "  <key>WatchPaths</key><array/>\n"
    "</dict>\n</plist>\n");
  auto p = harbor::util::parse_plist(data);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->strings.at("Label"), "com.example.agent");
  ASSERT_TRUE(p->bools.at("RunAtLoad"));
  ASSERT_TRUE(!p->bools.at("Disabled"));
  const auto& args = p->string_arrays.at("ProgramArguments");
  ASSERT_EQ(args.size(), 2u);
  ASSERT_EQ(args[0], "/bin/zsh");
  ASSERT_EQ(args[1], "-c");
  ASSERT_TRUE(p->string_arrays.at("WatchPaths").empty());
  ASSERT_TRUE(p->strings.find("x") == p->strings.end());
}

TEST(plist_rejects_non_plist) {
  ASSERT_TRUE(!harbor::util::parse_plist_strings(bytes("not a plist")).has_value());
  ASSERT_TRUE(!harbor::util::parse_plist_strings(bytes("bplist00")).has_value());
}

TEST(plist_binary_single_entry) {
  std::vector<unsigned char> d;
  auto put = [&](const std::string& s) { d.insert(d.end(), s.begin(), s.end()); };
  put("bplist00");
  // object 0 at 8: dict of one pair, key ref 1, value ref 2
  d.insert(d.end(), {0xD1, 0x01, 0x02});
  // object 1 at 11: ASCII string, 18 bytes, length carried in a following int
  d.insert(d.end(), {0x5F, 0x10, 0x12});
  put("CFBundleIdentifier");
  // object 2 at 32
  d.insert(d.end(), {0x5F, 0x10, 0x0F});
  put("com.example.App");
  // offset table at 50
  d.insert(d.end(), {0x08, 0x0B, 0x20});
  // trailer
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0x01, 0x01});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 3});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 50});
  ASSERT_EQ(d.size(), 85u);

  auto p = harbor::util::parse_plist_strings(d);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->size(), 1u);
  ASSERT_EQ(p->at("CFBundleIdentifier"), "com.example.App");
}

TEST(plist_binary_bool_and_array) {
  std::vector<unsigned char> d;
  auto put = [&](const std::string& s) { d.insert(d.end(), s.begin(), s.end()); };
  put("bplist00");
  // object 0 at 8: dict of two pairs, keys 1 2, values 3 4
  d.insert(d.end(), {0xD2, 0x01, 0x02, 0x03, 0x04});
  d.push_back(0x58);               // object 1 at 13
  put("Disabled");
  d.insert(d.end(), {0x5F, 0x10, 0x10});  // object 2 at 22
  put("ProgramArguments");
  d.push_back(0x09);               // object 3 at 41: true
  d.insert(d.end(), {0xA2, 0x05, 0x06});  // object 4 at 42: array of 5 6
  d.push_back(0x58);               // object 5 at 45
  put("/bin/zsh");
  d.push_back(0x52);               // object 6 at 54
  put("-c");
  // offset table at 57
  d.insert(d.end(), {0x08, 0x0D, 0x16, 0x29, 0x2A, 0x2D, 0x36});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0x01, 0x01});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 7});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 57});
  ASSERT_EQ(d.size(), 96u);

  auto p = harbor::util::parse_plist(d);
  ASSERT_TRUE(p.has_value());
  ASSERT_TRUE(p->bools.at("Disabled"));
  const auto& args = p->string_arrays.at("ProgramArguments");
  ASSERT_EQ(args.size(), 2u);
  ASSERT_EQ(args[0], "/bin/zsh");
  ASSERT_EQ(args[1], "-c");
  ASSERT_TRUE(p->strings.empty());
}

TEST(plist_binary_truncated_table) {
  std::vector<unsigned char> d;
  std::string magic = "bplist00";
  d.insert(d.end(), magic.begin(), magic.end());
  d.insert(d.end(), {0xD0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0x01, 0x01});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 9});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 8});
  ASSERT_TRUE(!harbor::util::parse_plist_strings(d).has_value());
}

// trailer with 1-byte offsets and refs
static void put_trailer(std::vector<unsigned char>& d, unsigned char objects, unsigned char table_at) {
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0x01, 0x01});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, objects});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, table_at});
}

TEST(plist_binary_oversized_string_length) {
  std::vector<unsigned char> d;
  auto put = [&](const std::string& s) { d.insert(d.end(), s.begin(), s.end()); };
  put("bplist00");
  d.insert(d.end(), {0xD1, 0x01, 0x02});
  // object 1 at 11: ASCII string claiming 0xFFFFFFFFFFFFFFF8 bytes
  d.insert(d.end(), {0x5F, 0x13, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF8});
  // object 2 at 21
  d.insert(d.end(), {0x5F, 0x10, 0x0F});
  put("com.example.App");
  d.insert(d.end(), {0x08, 0x0B, 0x15});
  put_trailer(d, 3, 39);
  ASSERT_EQ(d.size(), 74u);

  auto p = harbor::util::parse_plist_strings(d);
  ASSERT_TRUE(p.has_value());
  ASSERT_TRUE(p->empty());
}

TEST(plist_binary_oversized_dict_count) {
  std::vector<unsigned char> d;
  std::string magic = "bplist00";
  d.insert(d.end(), magic.begin(), magic.end());
  d.insert(d.end(), {0xDF, 0x13, 0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF8});
  d.insert(d.end(), {0x08});
  put_trailer(d, 1, 18);
  ASSERT_TRUE(!harbor::util::parse_plist_strings(d).has_value());
}

TEST(plist_binary_offset_table_past_trailer) {
  std::vector<unsigned char> d;
  std::string magic = "bplist00";
  d.insert(d.end(), magic.begin(), magic.end());
  d.insert(d.end(), {0xD0, 0x08});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0x01, 0x01});
  d.insert(d.end(), {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 0});
  d.insert(d.end(), {0, 0, 0, 0, 0, 0, 0, 9});
  ASSERT_TRUE(!harbor::util::parse_plist_strings(d).has_value());
}

TEST(plist_missing_file) {
  ASSERT_TRUE(!harbor::util::read_plist_strings("/nonexistent/harbor/Info.plist").has_value());
}
