#pragma once

#include <filesystem>

namespace fitsview {
namespace fs = std::filesystem;
}  // namespace fitsview
