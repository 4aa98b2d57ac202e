#pragma once

#include "dayinit/config.hpp"
#include "dayinit/error.hpp"
#include "dayinit/registry.hpp"
#include "dayinit/scaffold.hpp"
#include "dayinit/settings.hpp"
#include "dayinit/splice.hpp"
