/*
 * ToolGate C++ - Action provider interface
 *
 * A provider owns a group of related actions. The application calls
 * init() with the loaded configuration, then register_actions() once
 * before the registry is frozen.
 */
#ifndef toolgate_CORE_PROVIDER_HPP
#define toolgate_CORE_PROVIDER_HPP

namespace toolgate {

class Config;
class ToolRegistry;

class ActionProvider {
public:
    virtual ~ActionProvider() {}

    virtual const char* name() const = 0;
    virtual const char* description() const = 0;

    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() {}

    // Throws RegistrationError on duplicate names.
    virtual void register_actions(ToolRegistry& registry) = 0;
};

} // namespace toolgate

#endif // toolgate_CORE_PROVIDER_HPP
