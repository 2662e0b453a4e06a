#include "FileContent.hpp"

void FileContent::replaceAll(const std::vector<byte>& buf) {
    data_ = buf;
}
