#include "store/user_key.hpp"

namespace
{
    inline bool key_char(unsigned char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    }
} // namespace

std::string sanitize_user_key(const std::string &raw)
{
    std::string out;
    out.reserve(raw.size() < MAX_USER_KEY_LEN ? raw.size() : MAX_USER_KEY_LEN);
    for (unsigned char c : raw)
    {
        if (!key_char(c))
            continue;
        out.push_back(static_cast<char>(c));
        if (out.size() == MAX_USER_KEY_LEN)
            break;
    }
    return out;
}

bool is_valid_user_key(const std::string &key)
{
    if (key.empty() || key.size() > MAX_USER_KEY_LEN)
        return false;
    for (unsigned char c : key)
        if (!key_char(c))
            return false;
    return true;
}
