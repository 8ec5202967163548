#pragma once
#include <optional>
#include <string>

// Tests use the Windows spelling _putenv("NAME=VALUE"); "NAME=" unsets.
#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

// Sets a COOK_* variable for the lifetime of the object, then restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};
