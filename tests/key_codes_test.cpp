#include <sstv/key_codes.h>

#include "gtest/gtest.h"

#include <set>

TEST(KeyCodesTest, CatalogHasUniqueKeyNames) {
    const auto& keys = known_key_codes();
    ASSERT_FALSE(keys.empty());

    std::set<std::string> names;
    for (const auto& key : keys) {
        EXPECT_TRUE(is_key_code(key.name)) << key.name;
        EXPECT_FALSE(key.description.empty()) << key.name;
        EXPECT_TRUE(names.insert(key.name).second) << "duplicate " << key.name;
    }
}

TEST(KeyCodesTest, FindsKnownKeys) {
    const KeyCode* key = find_key_code("KEY_VOLUP");
    ASSERT_NE(nullptr, key);
    EXPECT_EQ("KEY_VOLUP", key->name);

    EXPECT_EQ(nullptr, find_key_code("KEY_DOES_NOT_EXIST"));
    EXPECT_EQ(nullptr, find_key_code("key_volup"));
}

TEST(KeyCodesTest, KeyPrefixDecidesCommandKind) {
    EXPECT_TRUE(is_key_code("KEY_POWEROFF"));
    EXPECT_TRUE(is_key_code("KEY_SOMETHING_NEW"));
    EXPECT_FALSE(is_key_code("hello"));
    EXPECT_FALSE(is_key_code("CH12"));
    EXPECT_FALSE(is_key_code("xKEY_1"));
}

TEST(KeyCodesTest, ChannelDigitsMapToCatalogKeys) {
    for (char digit = '0'; digit <= '9'; digit++) {
        std::string name = channel_digit_key(digit);
        EXPECT_EQ(std::string("KEY_") + digit, name);
        EXPECT_NE(nullptr, find_key_code(name)) << name;
    }
}
