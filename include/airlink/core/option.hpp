#pragma once
#include <optional>
namespace airlink {
template<typename T>
using Option = std::optional<T>;
}
