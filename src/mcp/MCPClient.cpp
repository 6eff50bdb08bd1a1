#include "mcp/MCPClient.h"
#include "mcp/JsonRpc.h"
#include "utils/Logger.h"
#include <future>
#include <cstring>
#include <cerrno>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#endif

// ---------------------------------------------------------------------------
// RemoteMCPClient

RemoteMCPClient::RemoteMCPClient(std::string name, std::chrono::milliseconds requestTimeout)
    : name(std::move(name)), requestTimeout(requestTimeout) {}

void RemoteMCPClient::start() {
    connect();

    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcphub"}, {"version", "1.0.0"}}}
    };
    auto outcome = requestSync("initialize", params);
    if (!outcome.ok()) {
        stop();
        throw HubError(outcome.error->getCode(),
                       "Failed to initialize '" + name + "': " + outcome.error->what());
    }
    serverInfo = outcome.result.value("serverInfo", nlohmann::json::object());
    serverCapabilities = outcome.result.value("capabilities", nlohmann::json::object());
    sendNotification("notifications/initialized", nlohmann::json::object());
    Logger::getInstance().info("Connected to '" + name + "' (" + getTransportType() + ")");
}

CallOutcome RemoteMCPClient::requestSync(const std::string& method, const nlohmann::json& params) {
    auto promise = std::make_shared<std::promise<CallOutcome>>();
    auto future = promise->get_future();
    Completion once([promise](const CallOutcome& outcome) { promise->set_value(outcome); });

    sendRequest(method, params, [once](const CallOutcome& outcome) { once.deliver(outcome); });

    // The transport enforces the deadline; the extra second only guards a broken transport
    if (future.wait_for(requestTimeout + std::chrono::seconds(1)) != std::future_status::ready) {
        once.fail(ErrorCode::TransportTimeout, method + " timed out after " +
                  std::to_string(requestTimeout.count()) + " ms");
    }
    return future.get();
}

nlohmann::json RemoteMCPClient::listAll(const std::string& method, const std::string& key) {
    nlohmann::json items = nlohmann::json::array();
    nlohmann::json params = nlohmann::json::object();
    while (true) {
        auto outcome = requestSync(method, params);
        if (!outcome.ok()) {
            Logger::getInstance().debug("'" + name + "' " + method + " failed: " + outcome.error->what());
            break;
        }
        if (outcome.result.contains(key) && outcome.result[key].is_array()) {
            for (const auto& item : outcome.result[key]) items.push_back(item);
        }
        if (!outcome.result.contains("nextCursor") || !outcome.result["nextCursor"].is_string()) break;
        params["cursor"] = outcome.result["nextCursor"];
    }
    return items;
}

Capabilities RemoteMCPClient::listCapabilities() {
    Capabilities caps;
    if (serverCapabilities.contains("tools")) {
        caps.tools = listAll("tools/list", "tools").get<std::vector<ToolDescriptor>>();
    }
    if (serverCapabilities.contains("resources")) {
        caps.resources = listAll("resources/list", "resources").get<std::vector<ResourceDescriptor>>();
        caps.resourceTemplates = listAll("resources/templates/list", "resourceTemplates")
                                     .get<std::vector<ResourceTemplateDescriptor>>();
    }
    if (serverCapabilities.contains("prompts")) {
        caps.prompts = listAll("prompts/list", "prompts").get<std::vector<PromptDescriptor>>();
    }
    return caps;
}

void RemoteMCPClient::callTool(const std::string& tool, const nlohmann::json& arguments, Completion done) {
    sendRequest("tools/call", {{"name", tool}, {"arguments", arguments}},
                [done](const CallOutcome& outcome) { done.deliver(outcome); });
}

void RemoteMCPClient::readResource(const ResourceMatch& match, Completion done) {
    sendRequest("resources/read", {{"uri", match.uri}},
                [done](const CallOutcome& outcome) { done.deliver(outcome); });
}

void RemoteMCPClient::getPrompt(const std::string& prompt, const nlohmann::json& arguments, Completion done) {
    sendRequest("prompts/get", {{"name", prompt}, {"arguments", arguments}},
                [done](const CallOutcome& outcome) { done.deliver(outcome); });
}

void RemoteMCPClient::handleIncoming(const nlohmann::json& message) {
    std::string method = message.value("method", "");
    nlohmann::json params = message.value("params", nlohmann::json::object());

    if (message.contains("id")) {
        // Server->client request; only ping is supported
        if (method == "ping") {
            sendResponse(JsonRpc::makeResult(message["id"], nlohmann::json::object()));
        } else {
            sendResponse(JsonRpc::makeError(message["id"], JsonRpc::METHOD_NOT_FOUND, "Method not found: " + method));
        }
        return;
    }

    Logger::getInstance().debug("'" + name + "' notification: " + method);
    if (notificationHandler) {
        notificationHandler(method, params);
    }
}

// ---------------------------------------------------------------------------
// MCPClient (stdio)

MCPClient::MCPClient(const Config::ServerConfig& config, std::chrono::milliseconds requestTimeout)
    : RemoteMCPClient(config.name, requestTimeout), config(config) {}

MCPClient::~MCPClient() {
    stopProcess();
}

void MCPClient::stop() {
    stopProcess();
}

#ifndef _WIN32
void MCPClient::connect() {
    if (childPid > 0) {
        if (running) return;
        stopProcess();  // reap a child that already exited
    }

    int inPipe[2];
    int outPipe[2];
    if (pipe(inPipe) != 0) {
        throw HubError(ErrorCode::Transport, std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (pipe(outPipe) != 0) {
        close(inPipe[0]);
        close(inPipe[1]);
        throw HubError(ErrorCode::Transport, std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<std::string> argvStore;
    argvStore.push_back(config.command);
    argvStore.insert(argvStore.end(), config.args.begin(), config.args.end());

    childPid = fork();
    if (childPid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
        }
        close(inPipe[1]);
        close(outPipe[0]);

        for (const auto& [key, value] : config.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        if (!config.cwd.empty() && chdir(config.cwd.c_str()) != 0) {
            _exit(127);
        }

        std::vector<char*> argv;
        argv.reserve(argvStore.size() + 1);
        for (auto& arg : argvStore) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    if (childPid < 0) {
        close(inPipe[0]);
        close(inPipe[1]);
        close(outPipe[0]);
        close(outPipe[1]);
        childPid = -1;
        throw HubError(ErrorCode::Transport, std::string("fork() failed: ") + std::strerror(errno));
    }

    close(inPipe[0]);
    close(outPipe[1]);
    writeFd = inPipe[1];
    readFd = outPipe[0];
    // A dead child must surface as EPIPE, not kill the hub
    signal(SIGPIPE, SIG_IGN);

    stopReader = false;
    running = true;
    readerThread = std::thread(&MCPClient::readerLoop, this);
    Logger::getInstance().debug("Spawned '" + name + "' (pid " + std::to_string(childPid) + "): " + config.command);
}

void MCPClient::stopProcess() {
    if (childPid <= 0) return;
    stopReader = true;
    if (readerThread.joinable()) readerThread.join();
    if (readFd >= 0) close(readFd);
    {
        std::lock_guard<std::mutex> lock(writeMtx);
        if (writeFd >= 0) close(writeFd);
        writeFd = -1;
    }
    readFd = -1;
    kill(childPid, SIGTERM);
    int status = 0;
    waitpid(childPid, &status, 0);
    childPid = -1;
    running = false;
    failAllPending(ErrorCode::Transport, "Server '" + name + "' was stopped");
}

bool MCPClient::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(writeMtx);
    if (writeFd < 0) return false;
    const char* data = line.c_str();
    ssize_t total = 0;
    ssize_t len = static_cast<ssize_t>(line.size());
    while (total < len) {
        ssize_t n = write(writeFd, data + total, len - total);
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

void MCPClient::readerLoop() {
    std::string buffer;
    char temp[4096];
    std::string exitReason;

    while (!stopReader) {
        pollfd pfd{readFd, POLLIN, 0};
        int ready = poll(&pfd, 1, 100);
        expirePending();
        if (ready < 0) {
            if (errno == EINTR) continue;
            exitReason = std::string("poll() failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) continue;

        ssize_t n = read(readFd, temp, sizeof(temp));
        if (n <= 0) {
            exitReason = "Server process exited";
            break;
        }
        buffer.append(temp, temp + n);

        std::size_t newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            handleLine(line);
        }
    }

    if (!exitReason.empty() && !stopReader) {
        running = false;
        Logger::getInstance().warn("'" + name + "': " + exitReason);
        failAllPending(ErrorCode::Transport, exitReason);
        if (exitHandler) exitHandler(exitReason);
    }
}
#else
void MCPClient::connect() {
    throw HubError(ErrorCode::Transport, "stdio servers are not supported on Windows");
}
void MCPClient::stopProcess() {}
bool MCPClient::writeLine(const std::string&) { return false; }
void MCPClient::readerLoop() {}
#endif

void MCPClient::handleLine(const std::string& line) {
    // Skip non-JSON noise (banners, logs) some servers print on stdout
    if (line.empty() || line[0] != '{') return;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        Logger::getInstance().trace("'" + name + "' non-JSON line: " + line);
        return;
    }

    if (!JsonRpc::isResponse(message)) {
        handleIncoming(message);
        return;
    }
    if (!message["id"].is_number_integer()) return;

    ResponseCallback callback;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = pending.find(message["id"].get<int>());
        if (it == pending.end()) return;  // late reply to an expired request
        callback = std::move(it->second.callback);
        pending.erase(it);
    }
    callback(JsonRpc::toOutcome(message));
}

void MCPClient::expirePending() {
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, ResponseCallback>> expired;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto it = pending.begin(); it != pending.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->second.method, std::move(it->second.callback));
                it = pending.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [method, callback] : expired) {
        callback(CallOutcome::failure(ErrorCode::TransportTimeout,
                 "Request " + method + " to '" + name + "' timed out after " +
                 std::to_string(requestTimeout.count()) + " ms"));
    }
}

void MCPClient::failAllPending(ErrorCode code, const std::string& message) {
    std::map<int, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mtx);
        failed.swap(pending);
    }
    for (auto& [id, request] : failed) {
        request.callback(CallOutcome::failure(code, message));
    }
}

void MCPClient::sendRequest(const std::string& method, const nlohmann::json& params, ResponseCallback onResponse) {
    if (!running) {
        onResponse(CallOutcome::failure(ErrorCode::Transport, "Server '" + name + "' is not running"));
        return;
    }

    int id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        id = ++requestId;
        pending[id] = PendingRequest{method, std::chrono::steady_clock::now() + requestTimeout, onResponse};
    }

    if (!writeLine(JsonRpc::makeRequest(id, method, params).dump() + "\n")) {
        ResponseCallback callback;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = pending.find(id);
            if (it == pending.end()) return;
            callback = std::move(it->second.callback);
            pending.erase(it);
        }
        callback(CallOutcome::failure(ErrorCode::Transport, "Failed to write to '" + name + "'"));
    }
}

void MCPClient::sendNotification(const std::string& method, const nlohmann::json& params) {
    if (!writeLine(JsonRpc::makeNotification(method, params).dump() + "\n")) {
        Logger::getInstance().debug("Failed to send " + method + " to '" + name + "'");
    }
}

void MCPClient::sendResponse(const nlohmann::json& response) {
    if (!writeLine(response.dump() + "\n")) {
        Logger::getInstance().debug("Failed to answer '" + name + "'");
    }
}
