#pragma once

namespace elapsed {

constexpr const char* kVersion = "0.1.0";

}
