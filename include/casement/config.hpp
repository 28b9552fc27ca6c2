#pragma once

#include <casement/logger.hpp>
#include <casement/viewport.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace casement
{

// When a viewport's surface is cleared relative to running its UI.
enum class ClearPolicy
{
    BeforeUi,   // clear, run UI, paint
    AfterUi,    // run UI, clear, paint
    Auto,       // BeforeUi while only one viewport is live, AfterUi otherwise
};

const char*                clear_policy_name(ClearPolicy policy);
std::optional<ClearPolicy> clear_policy_from_string(std::string_view name);

struct AppConfig
{
    bool               headless = false;
    ViewportAttributes root_attributes;
    ClearPolicy        clear_policy          = ClearPolicy::Auto;
    bool               vsync                 = true;
    bool               skip_redundant_rebind = true;
    bool               validation            = false;   // Vulkan validation layers
    uint64_t           max_passes            = 0;       // 0 = until the root closes
    LogLevel           log_level             = LogLevel::Info;
    bool               log_to_console        = true;
    std::string        log_file;

    // Overrides from CASEMENT_HEADLESS, CASEMENT_LOG_LEVEL, CASEMENT_LOG_FILE,
    // CASEMENT_CLEAR_POLICY and CASEMENT_VSYNC. Unparseable values are logged
    // and ignored.
    void apply_env();
};

}   // namespace casement
