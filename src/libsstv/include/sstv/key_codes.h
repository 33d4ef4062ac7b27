#pragma once

#include <string>
#include <utility>
#include <vector>

struct KeyCode {
    std::string name;
    std::string description;
};

// Common key codes understood by D-series and later devices
const std::vector<KeyCode>& known_key_codes();

/**
 * Look up a catalog entry
 * @return Entry or nullptr if the code is not in the catalog
 */
const KeyCode* find_key_code(const std::string& name);

// Anything starting with "KEY_" is sent as a key press, the rest as text
bool is_key_code(const std::string& command);

// "KEY_0" .. "KEY_9"
std::string channel_digit_key(char digit);
