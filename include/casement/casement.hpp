#pragma once

#include <casement/app.hpp>
#include <casement/config.hpp>
#include <casement/errors.hpp>
#include <casement/input.hpp>
#include <casement/logger.hpp>
#include <casement/math.hpp>
#include <casement/platform.hpp>
#include <casement/ui.hpp>
#include <casement/viewport.hpp>
