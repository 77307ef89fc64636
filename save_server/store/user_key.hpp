#pragma once
#include <string>
#include <cstddef>

static constexpr size_t MAX_USER_KEY_LEN = 64;

// 只保留 [A-Za-z0-9_-]，再截断到 MAX_USER_KEY_LEN。全函数，不会失败；
// 结果可能为空，由调用方决定是否拒绝。
std::string sanitize_user_key(const std::string &raw);

// 非空且 sanitize 后不变
bool is_valid_user_key(const std::string &key);
