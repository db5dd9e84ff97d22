#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Forest::Core {
enum class Error : std::uint8_t {
    Success = 0,
    InvalidOffset, // start position 不在 [0, capacity) 内
    NonContiguousInsertion, // start position 与当前叶子数不一致
    NotFound, // 叶子不在树中
    DuplicateNullifier, // nullifier 已存在
    InvalidDepth, // 深度不合法
    MalformedProof // proof 字节无法解码
};

class ForestErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "ForestCore"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::InvalidOffset:
            return "Invalid start position";
        case Error::NonContiguousInsertion:
            return "Start position does not match current tree length";
        case Error::NotFound:
            return "Element not found in tree";
        case Error::DuplicateNullifier:
            return "Nullifier already exists";
        case Error::InvalidDepth:
            return "Tree depth must be between 1 and 32";
        case Error::MalformedProof:
            return "Malformed merkle proof encoding";
        default:
            return "Unknown forest error";
        }
    }
};

inline const std::error_category& forest_category()
{
    static ForestErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), forest_category() };
}
} // namespace Forest::Core

namespace std {
template <>
struct is_error_code_enum<Forest::Core::Error> : true_type { };
} // namespace std
