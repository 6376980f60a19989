#pragma once

#include <memory>

struct environment;
using environment_ptr = std::shared_ptr<environment>;
