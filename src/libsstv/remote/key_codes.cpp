#include <sstv/key_codes.h>

const std::vector<KeyCode>& known_key_codes() {
    static const std::vector<KeyCode> keys = {
        {"KEY_POWEROFF", "Power off"},
        {"KEY_SOURCE", "Cycle input source"},
        {"KEY_TV", "TV tuner"},
        {"KEY_HDMI", "HDMI input"},
        {"KEY_HDMI1", "HDMI 1"},
        {"KEY_HDMI2", "HDMI 2"},
        {"KEY_HDMI3", "HDMI 3"},
        {"KEY_HDMI4", "HDMI 4"},
        {"KEY_AV1", "AV input"},
        {"KEY_COMPONENT1", "Component input"},
        {"KEY_PCMODE", "PC input"},

        {"KEY_0", "Digit 0"}, {"KEY_1", "Digit 1"}, {"KEY_2", "Digit 2"},
        {"KEY_3", "Digit 3"}, {"KEY_4", "Digit 4"}, {"KEY_5", "Digit 5"},
        {"KEY_6", "Digit 6"}, {"KEY_7", "Digit 7"}, {"KEY_8", "Digit 8"},
        {"KEY_9", "Digit 9"},
        {"KEY_PLUS100", "Channel separator"},
        {"KEY_PRECH", "Previous channel"},
        {"KEY_CHUP", "Channel up"},
        {"KEY_CHDOWN", "Channel down"},
        {"KEY_CH_LIST", "Channel list"},
        {"KEY_FAVCH", "Favourite channels"},

        {"KEY_VOLUP", "Volume up"},
        {"KEY_VOLDOWN", "Volume down"},
        {"KEY_MUTE", "Mute"},

        {"KEY_MENU", "Menu"},
        {"KEY_HOME", "Smart Hub home"},
        {"KEY_CONTENTS", "Smart Hub contents"},
        {"KEY_GUIDE", "Programme guide"},
        {"KEY_INFO", "Info"},
        {"KEY_TOOLS", "Tools"},
        {"KEY_RETURN", "Return"},
        {"KEY_EXIT", "Exit"},
        {"KEY_UP", "Up"},
        {"KEY_DOWN", "Down"},
        {"KEY_LEFT", "Left"},
        {"KEY_RIGHT", "Right"},
        {"KEY_ENTER", "Enter / OK"},

        {"KEY_RED", "Red"},
        {"KEY_GREEN", "Green"},
        {"KEY_YELLOW", "Yellow"},
        {"KEY_CYAN", "Blue"},

        {"KEY_PLAY", "Play"},
        {"KEY_PAUSE", "Pause"},
        {"KEY_STOP", "Stop"},
        {"KEY_REC", "Record"},
        {"KEY_REWIND", "Rewind"},
        {"KEY_FF", "Fast forward"},

        {"KEY_TTX_MIX", "Teletext"},
        {"KEY_SUB_TITLE", "Subtitles"},
        {"KEY_PICTURE_SIZE", "Picture size"},
        {"KEY_ASPECT", "Aspect ratio"},
        {"KEY_PMODE", "Picture mode"},
        {"KEY_SLEEP", "Sleep timer"},
        {"KEY_W_LINK", "Media play"},
        {"KEY_RSS", "Internet"},
        {"KEY_AD", "Audio description"},
        {"KEY_MTS", "Dual audio"},
    };
    return keys;
}

const KeyCode* find_key_code(const std::string& name) {
    for (const auto& key : known_key_codes()) {
        if (key.name == name) {
            return &key;
        }
    }
    return nullptr;
}

bool is_key_code(const std::string& command) {
    return command.rfind("KEY_", 0) == 0;
}

std::string channel_digit_key(char digit) {
    return std::string("KEY_") + digit;
}
