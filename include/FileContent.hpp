#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <utility>

class FileContent {
public:
    using byte = std::uint8_t;

    FileContent() = default;
    explicit FileContent(std::vector<byte> data) : data_(std::move(data)) {}

    std::size_t size() const noexcept { return data_.size(); }
    const std::vector<byte>& bytes() const noexcept { return data_; }

    void replaceAll(const std::vector<byte>& buf);

    // Text sugar
    void assignText(const std::string& s) { replaceAll(std::vector<byte>(s.begin(), s.end())); }
    std::string asText() const { return std::string(data_.begin(), data_.end()); }

private:
    std::vector<byte> data_;
};
