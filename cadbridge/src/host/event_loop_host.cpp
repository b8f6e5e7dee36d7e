#include "host/event_loop_host.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <stdexcept>
#include <utility>

namespace cadbridge::host {

namespace {

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool parse_expression(const std::string& expression, double& value, std::string& unit, std::string& error) {
    std::string text = trim(expression);
    if (text.empty()) {
        error = "expression is empty";
        return false;
    }

    size_t consumed = 0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        error = "'" + expression + "' is not a valid expression";
        return false;
    }

    std::string rest = trim(text.substr(consumed));
    for (char c : rest) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            error = "'" + expression + "' has an invalid unit";
            return false;
        }
    }
    unit = rest;
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// LocalDocument

LocalDocument::LocalDocument(std::string name, std::string root_name)
    : name_(std::move(name)), root_(std::move(root_name)) {}

std::string LocalDocument::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

std::vector<Parameter> LocalDocument::user_parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_parameters_;
}

std::optional<Parameter> LocalDocument::parameter_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& list : {&user_parameters_, &model_parameters_}) {
        for (const auto& param : *list) {
            if (param.name == name) {
                return param;
            }
        }
    }
    return std::nullopt;
}

Parameter* LocalDocument::find_locked(const std::string& name) {
    for (auto* list : {&user_parameters_, &model_parameters_}) {
        for (auto& param : *list) {
            if (param.name == name) {
                return &param;
            }
        }
    }
    return nullptr;
}

bool LocalDocument::set_parameter_expression(
    const std::string& name, const std::string& expression, std::string& error) {
    double value = 0.0;
    std::string unit;
    if (!parse_expression(expression, value, unit, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Parameter* param = find_locked(name);
    if (!param) {
        error = "parameter '" + name + "' does not exist";
        return false;
    }
    param->value = value;
    param->expression = trim(expression);
    if (!unit.empty()) {
        param->unit = unit;
    }
    return true;
}

bool LocalDocument::add_user_parameter(const std::string& name, const std::string& expression, const std::string& comment) {
    Parameter param;
    std::string error;
    if (name.empty() || !parse_expression(expression, param.value, param.unit, error)) {
        return false;
    }
    param.name = name;
    param.expression = trim(expression);
    param.comment = comment;

    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(name)) {
        return false;
    }
    user_parameters_.push_back(std::move(param));
    return true;
}

bool LocalDocument::add_model_parameter(const std::string& name, const std::string& expression) {
    Parameter param;
    std::string error;
    if (name.empty() || !parse_expression(expression, param.value, param.unit, error)) {
        return false;
    }
    param.name = name;
    param.expression = trim(expression);

    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(name)) {
        return false;
    }
    model_parameters_.push_back(std::move(param));
    return true;
}

void LocalDocument::record_transaction(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    transactions_.push_back(label);
}

std::vector<std::string> LocalDocument::transaction_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transactions_;
}

// ---------------------------------------------------------------------------
// LocalViewport

bool LocalViewport::save_as_image_file(const std::string& path, int width, int height) {
    if (width <= 0 || height <= 0) {
        width = width_;
        height = height_;
    }
    if (path.empty() || width <= 0 || height <= 0) {
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG4CPLUS_ERROR(host_logger(), "Cannot open image file " << path);
        return false;
    }

    out << "P6\n" << width << " " << height << "\n255\n";
    const std::string row(static_cast<size_t>(width) * 3, static_cast<char>(0xE6));
    for (int y = 0; y < height; ++y) {
        out.write(row.data(), static_cast<std::streamsize>(row.size()));
    }
    return static_cast<bool>(out);
}

// ---------------------------------------------------------------------------
// Commands

class LocalCommandDefinition;

class LocalCommand final : public Command {
public:
    explicit LocalCommand(std::shared_ptr<LocalCommandDefinition> definition)
        : definition_(std::move(definition)) {}

    CommandEvent& on_execute() override { return execute_; }
    CommandEvent& on_destroy() override { return destroy_; }
    void set_auto_execute(bool value) override { auto_execute_ = value; }
    bool is_auto_execute() const override { return auto_execute_; }
    CommandDefinition& parent_definition() override;

private:
    std::shared_ptr<LocalCommandDefinition> definition_;
    CommandEvent execute_;
    CommandEvent destroy_;
    bool auto_execute_ = false;
};

class LocalCommandDefinition final : public CommandDefinition,
                                     public std::enable_shared_from_this<LocalCommandDefinition> {
public:
    LocalCommandDefinition(EventLoopHost& host, LocalCommandDefinitions& registry, std::string id, std::string name)
        : host_(host), registry_(registry), id_(std::move(id)), name_(std::move(name)) {}

    const std::string& id() const override { return id_; }
    const std::string& name() const override { return name_; }
    CommandCreatedEvent& on_command_created() override { return created_; }
    bool execute() override;
    bool delete_me() override;

private:
    EventLoopHost& host_;
    LocalCommandDefinitions& registry_;
    std::string id_;
    std::string name_;
    CommandCreatedEvent created_;
    std::atomic<bool> deleted_{false};

    void run_created();
    void run_execute(const std::shared_ptr<LocalCommand>& command);
    void run_destroy(const std::shared_ptr<LocalCommand>& command);
};

CommandDefinition& LocalCommand::parent_definition() {
    return *definition_;
}

class LocalCommandDefinitions final : public CommandDefinitions {
public:
    explicit LocalCommandDefinitions(EventLoopHost& host) : host_(host) {}

    CommandDefinition* add_button_definition(
        const std::string& id, const std::string& name, const std::string& tooltip) override {
        if (id.empty()) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (definitions_.count(id) != 0) {
            LOG4CPLUS_WARN(host_logger(), "Command definition already exists: " << id);
            return nullptr;
        }
        auto definition = std::make_shared<LocalCommandDefinition>(host_, *this, id, name);
        LOG4CPLUS_DEBUG(host_logger(), "Command definition " << id << " added (" << tooltip << ")");
        auto* raw = definition.get();
        definitions_.emplace(id, std::move(definition));
        return raw;
    }

    CommandDefinition* item_by_id(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = definitions_.find(id);
        if (it == definitions_.end()) {
            return nullptr;
        }
        return it->second.get();
    }

    size_t count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return definitions_.size();
    }

    bool remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return definitions_.erase(id) != 0;
    }

private:
    EventLoopHost& host_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<LocalCommandDefinition>> definitions_;
};

bool LocalCommandDefinition::execute() {
    if (deleted_ || !host_.is_running()) {
        return false;
    }
    auto self = shared_from_this();
    host_.post([self]() { self->run_created(); });
    return true;
}

bool LocalCommandDefinition::delete_me() {
    if (deleted_.exchange(true)) {
        return false;
    }
    // Keep this object alive until the current event finishes.
    auto self = shared_from_this();
    return registry_.remove(id_);
}

void LocalCommandDefinition::run_created() {
    auto self = shared_from_this();
    auto command = std::make_shared<LocalCommand>(self);

    CommandCreatedEventArgs args{*command};
    try {
        created_.notify(args);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(host_logger(), "commandCreated handler failed for " << id_ << ": " << exc.what());
        host_.post([self, command]() { self->run_destroy(command); });
        return;
    }

    if (command->is_auto_execute()) {
        host_.post([self, command]() { self->run_execute(command); });
    } else {
        // No dialog in a headless host: the command is torn down unexecuted.
        LOG4CPLUS_DEBUG(host_logger(), "Command " << id_ << " not auto-executed, destroying");
        host_.post([self, command]() { self->run_destroy(command); });
    }
}

void LocalCommandDefinition::run_execute(const std::shared_ptr<LocalCommand>& command) {
    auto self = shared_from_this();
    if (host_.active_document()) {
        host_.document().record_transaction(name_);
    }

    CommandEventArgs args{*command};
    try {
        command->on_execute().notify(args);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(host_logger(), "execute handler failed for " << id_ << ": " << exc.what());
    }
    host_.post([self, command]() { self->run_destroy(command); });
}

void LocalCommandDefinition::run_destroy(const std::shared_ptr<LocalCommand>& command) {
    CommandEventArgs args{*command};
    try {
        command->on_destroy().notify(args);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(host_logger(), "destroy handler failed for " << id_ << ": " << exc.what());
    }
}

// ---------------------------------------------------------------------------
// EventLoopHost

EventLoopHost::EventLoopHost(HostOptions options)
    : options_(std::move(options)),
      document_(options_.document_name, options_.root_component_name),
      viewport_(options_.viewport_width, options_.viewport_height),
      definitions_(std::make_unique<LocalCommandDefinitions>(*this)) {
    LOG4CPLUS_DEBUG(host_logger(), "Headless host created, document '" << options_.document_name << "'");
}

EventLoopHost::~EventLoopHost() {
    stop();
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

CommandDefinitions& EventLoopHost::command_definitions() {
    return *definitions_;
}

Document* EventLoopHost::active_document() {
    return document_open_ ? &document_ : nullptr;
}

Viewport* EventLoopHost::active_viewport() {
    return viewport_open_ ? &viewport_ : nullptr;
}

void EventLoopHost::post(std::function<void()> event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_all();
}

size_t EventLoopHost::pending_events() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

bool EventLoopHost::process_events() {
    if (!running_) {
        return false;
    }

    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }
    if (batch.empty()) {
        return false;
    }

    for (auto& event : batch) {
        try {
            event();
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(host_logger(), "Unhandled exception in host event: " << exc.what());
        }
    }
    return true;
}

void EventLoopHost::run_until(const std::function<bool()>& should_stop) {
    LOG4CPLUS_INFO(host_logger(), "Host event loop running");
    while (running_ && !should_stop()) {
        if (process_events()) {
            continue;
        }
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait_for(lock, std::chrono::milliseconds(100),
                           [this] { return !queue_.empty() || !running_; });
    }
    LOG4CPLUS_INFO(host_logger(), "Host event loop finished");
}

void EventLoopHost::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_cv_.notify_all();
    LOG4CPLUS_INFO(host_logger(), "Host stopped");
}

void EventLoopHost::show_message(const std::string& text) {
    LOG4CPLUS_WARN(host_logger(), "Message box: " << text);
    std::lock_guard<std::mutex> lock(messages_mutex_);
    messages_.push_back(text);
}

void EventLoopHost::close_document() {
    document_open_ = false;
}

void EventLoopHost::close_viewport() {
    viewport_open_ = false;
}

std::vector<std::string> EventLoopHost::messages() const {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    return messages_;
}

} // namespace cadbridge::host
