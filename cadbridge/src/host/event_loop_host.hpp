#pragma once

#include "host_api.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cadbridge::host {

struct HostOptions {
    std::string version = "cadbridge-headless";
    std::string document_name = "Untitled";
    std::string root_component_name = "root";
    int viewport_width = 800;
    int viewport_height = 600;
};

class LocalComponent final : public Component {
public:
    explicit LocalComponent(std::string name) : name_(std::move(name)) {}
    std::string name() const override { return name_; }

private:
    std::string name_;
};

/**
 * In-memory design document. Parameter expressions are "<number> [unit]".
 * Each auto-executed command is recorded as one undo entry.
 */
class LocalDocument final : public Document {
public:
    LocalDocument(std::string name, std::string root_name);

    std::string name() const override;
    Component* root_component() override { return &root_; }
    std::vector<Parameter> user_parameters() const override;
    std::optional<Parameter> parameter_by_name(const std::string& name) const override;
    bool set_parameter_expression(
        const std::string& name, const std::string& expression, std::string& error) override;

    bool add_user_parameter(const std::string& name, const std::string& expression, const std::string& comment = "");
    bool add_model_parameter(const std::string& name, const std::string& expression);

    void record_transaction(const std::string& label);
    std::vector<std::string> transaction_history() const;

private:
    mutable std::mutex mutex_;
    std::string name_;
    LocalComponent root_;
    std::vector<Parameter> user_parameters_;
    std::vector<Parameter> model_parameters_;
    std::vector<std::string> transactions_;

    Parameter* find_locked(const std::string& name);
};

class LocalViewport final : public Viewport {
public:
    LocalViewport(int width, int height) : width_(width), height_(height) {}
    int width() const override { return width_; }
    int height() const override { return height_; }
    /// Writes a binary PPM of the requested size.
    bool save_as_image_file(const std::string& path, int width, int height) override;

private:
    int width_;
    int height_;
};

class LocalCommandDefinitions;

/**
 * Headless single-dispatch host. Events may be posted from any thread;
 * process_events() drains them on the calling thread under one dispatch
 * lock, so callbacks never overlap.
 */
class EventLoopHost final : public Application {
public:
    explicit EventLoopHost(HostOptions options = {});
    ~EventLoopHost() override;

    EventLoopHost(const EventLoopHost&) = delete;
    EventLoopHost& operator=(const EventLoopHost&) = delete;

    std::string version() const override { return options_.version; }
    CommandDefinitions& command_definitions() override;
    Document* active_document() override;
    Viewport* active_viewport() override;
    bool process_events() override;
    bool is_running() const override { return running_.load(); }
    void show_message(const std::string& text) override;

    void post(std::function<void()> event);
    size_t pending_events() const;

    /// Pumps on the calling thread until should_stop() or stop().
    void run_until(const std::function<bool()>& should_stop);
    void stop();

    LocalDocument& document() { return document_; }
    void close_document();
    void close_viewport();
    std::vector<std::string> messages() const;

private:
    HostOptions options_;
    LocalDocument document_;
    LocalViewport viewport_;
    std::unique_ptr<LocalCommandDefinitions> definitions_;
    std::atomic<bool> document_open_{true};
    std::atomic<bool> viewport_open_{true};
    std::atomic<bool> running_{true};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    std::recursive_mutex dispatch_mutex_;

    mutable std::mutex messages_mutex_;
    std::vector<std::string> messages_;
};

} // namespace cadbridge::host
