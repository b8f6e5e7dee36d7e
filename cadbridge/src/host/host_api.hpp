#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cadbridge::host {

/**
 * Minimal model of the CAD host SDK the bridge consumes.
 *
 * Objects handed out by the host are owned by the host; callers hold raw
 * pointers that stay valid until the object is deleted through the host.
 * Everything except CommandDefinitions and process_events() must only be
 * touched from inside a command callback.
 */

template <typename Args>
class Event {
public:
    using Handler = std::function<void(Args&)>;

    void add(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    /// Invokes a snapshot of the handlers so a handler may add more.
    void notify(Args& args) const {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = handlers_;
        }
        for (const auto& handler : snapshot) {
            handler(args);
        }
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Handler> handlers_;
};

class Command;
class CommandDefinition;

struct CommandEventArgs {
    Command& command;
};

struct CommandCreatedEventArgs {
    Command& command;
};

using CommandEvent = Event<CommandEventArgs>;
using CommandCreatedEvent = Event<CommandCreatedEventArgs>;

class Command {
public:
    virtual ~Command() = default;
    virtual CommandEvent& on_execute() = 0;
    virtual CommandEvent& on_destroy() = 0;
    virtual void set_auto_execute(bool value) = 0;
    virtual bool is_auto_execute() const = 0;
    virtual CommandDefinition& parent_definition() = 0;
};

class CommandDefinition {
public:
    virtual ~CommandDefinition() = default;
    virtual const std::string& id() const = 0;
    virtual const std::string& name() const = 0;
    virtual CommandCreatedEvent& on_command_created() = 0;
    /// Queues the command; handlers run later inside the host pump.
    virtual bool execute() = 0;
    virtual bool delete_me() = 0;
};

/// Thread-safe registry of command definitions.
class CommandDefinitions {
public:
    virtual ~CommandDefinitions() = default;
    virtual CommandDefinition* add_button_definition(
        const std::string& id, const std::string& name, const std::string& tooltip) = 0;
    virtual CommandDefinition* item_by_id(const std::string& id) = 0;
    virtual size_t count() const = 0;
};

struct Parameter {
    std::string name;
    double value = 0.0;
    std::string unit;
    std::string expression;
    std::string comment;
};

class Component {
public:
    virtual ~Component() = default;
    virtual std::string name() const = 0;
};

class Document {
public:
    virtual ~Document() = default;
    virtual std::string name() const = 0;
    virtual Component* root_component() = 0;
    virtual std::vector<Parameter> user_parameters() const = 0;
    /// Looks through user and model parameters.
    virtual std::optional<Parameter> parameter_by_name(const std::string& name) const = 0;
    virtual bool set_parameter_expression(
        const std::string& name, const std::string& expression, std::string& error) = 0;
};

class Viewport {
public:
    virtual ~Viewport() = default;
    virtual int width() const = 0;
    virtual int height() const = 0;
    /// 0 for width or height means the viewport's own size.
    virtual bool save_as_image_file(const std::string& path, int width, int height) = 0;
};

class Application {
public:
    virtual ~Application() = default;
    virtual std::string version() const = 0;
    virtual CommandDefinitions& command_definitions() = 0;
    virtual Document* active_document() = 0;
    virtual Viewport* active_viewport() = 0;

    /// Runs one step of the cooperative event pump on the calling thread.
    /// Returns true when at least one queued event ran.
    virtual bool process_events() = 0;
    virtual bool is_running() const = 0;
    virtual void show_message(const std::string& text) = 0;
};

/// Capability namespace handed to a unit of work.
struct ExecutionScope {
    Application* app = nullptr;
    Document* document = nullptr;
    Component* root = nullptr;
};

/**
 * Drives the host pump until done() holds or the host stops running.
 * Returns done() at exit.
 */
template <typename Predicate>
bool drive_until(Application& app, Predicate done) {
    while (!done()) {
        if (!app.is_running()) {
            return done();
        }
        if (!app.process_events()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        } else {
            std::this_thread::yield();
        }
    }
    return true;
}

} // namespace cadbridge::host
