#include <algorithm>
#include <casement/config.hpp>
#include <casement/logger.hpp>
#include <cctype>
#include <cstdlib>
#include <string>

namespace casement
{

namespace
{

std::string lowercase(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<bool> parse_flag(std::string_view value)
{
    std::string v = lowercase(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

const char* env_value(const char* name)
{
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

}   // namespace

const char* clear_policy_name(ClearPolicy policy)
{
    switch (policy)
    {
        case ClearPolicy::BeforeUi:
            return "before_ui";
        case ClearPolicy::AfterUi:
            return "after_ui";
        case ClearPolicy::Auto:
            return "auto";
    }
    return "auto";
}

std::optional<ClearPolicy> clear_policy_from_string(std::string_view name)
{
    std::string v = lowercase(name);
    if (v == "before_ui" || v == "before")
        return ClearPolicy::BeforeUi;
    if (v == "after_ui" || v == "after")
        return ClearPolicy::AfterUi;
    if (v == "auto")
        return ClearPolicy::Auto;
    return std::nullopt;
}

void AppConfig::apply_env()
{
    if (const char* env = env_value("CASEMENT_HEADLESS"))
    {
        if (auto flag = parse_flag(env))
            headless = *flag;
        else
            CASEMENT_LOG_WARN("app", "Ignoring CASEMENT_HEADLESS={}", env);
    }

    if (const char* env = env_value("CASEMENT_LOG_LEVEL"))
    {
        if (auto level = Logger::level_from_string(env))
            log_level = *level;
        else
            CASEMENT_LOG_WARN("app", "Ignoring CASEMENT_LOG_LEVEL={}", env);
    }

    if (const char* env = env_value("CASEMENT_LOG_FILE"))
        log_file = env;

    if (const char* env = env_value("CASEMENT_CLEAR_POLICY"))
    {
        if (auto policy = clear_policy_from_string(env))
            clear_policy = *policy;
        else
            CASEMENT_LOG_WARN("app", "Ignoring CASEMENT_CLEAR_POLICY={}", env);
    }

    if (const char* env = env_value("CASEMENT_VSYNC"))
    {
        if (auto flag = parse_flag(env))
            vsync = *flag;
        else
            CASEMENT_LOG_WARN("app", "Ignoring CASEMENT_VSYNC={}", env);
    }
}

}   // namespace casement
