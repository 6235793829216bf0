#include <cowgnition/transport/stdio_transport.hpp>

#include <condition_variable>
#include <deque>
#include <optional>
#include <string>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "stdio";
constexpr std::chrono::milliseconds kPollInterval{50};

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

struct StdioTransport::SharedState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Result<std::string, Error>> frames;
    bool finished = false;  // reader saw EOF or a stream failure
    bool closed = false;
    std::optional<Error> failure;
};

StdioTransport::StdioTransport(std::istream& in, std::ostream& out,
                               std::size_t max_message_bytes,
                               std::shared_ptr<Logger> logger)
    : in_(in),
      out_(out),
      max_message_bytes_(max_message_bytes),
      logger_(logger ? std::move(logger) : MakeNullLogger()),
      state_(std::make_shared<SharedState>()) {}

StdioTransport::~StdioTransport() {
    Close();
    if (!reader_.joinable()) {
        return;
    }
    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        finished = state_->cv.wait_for(lock, kPollInterval * 2,
                                       [this] { return state_->finished; });
    }
    // A reader still blocked in getline on stdin cannot be woken.
    if (finished) {
        reader_.join();
    } else {
        reader_.detach();
    }
}

void StdioTransport::StartReader() {
    reader_ = std::thread([state = state_, &in = in_, max = max_message_bytes_,
                           logger = logger_]() {
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (IsBlank(line)) {
                continue;
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) {
                break;
            }
            if (line.size() > max) {
                logger->Warn(kComponent, "Discarding message of " +
                                             std::to_string(line.size()) + " bytes");
                state->frames.push_back(Result<std::string, Error>::Err(Error{
                    "StdioRead",
                    "Message of " + std::to_string(line.size()) + " bytes exceeds the " +
                        std::to_string(max) + " byte limit",
                    ErrorCategory::Decode}));
            } else {
                state->frames.push_back(Result<std::string, Error>::Ok(std::move(line)));
            }
            state->cv.notify_all();
            line.clear();
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (in.bad()) {
            state->failure = Error{"StdioRead", "Input stream failed", ErrorCategory::Transport};
        }
        state->finished = true;
        state->cv.notify_all();
    });
}

Result<std::string, Error> StdioTransport::Read(const CancellationToken& token) {
    std::call_once(reader_started_, [this] { StartReader(); });

    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        if (!state_->frames.empty()) {
            auto frame = std::move(state_->frames.front());
            state_->frames.pop_front();
            return frame;
        }
        if (state_->failure) {
            return Result<std::string, Error>::Err(*state_->failure);
        }
        if (state_->finished || state_->closed) {
            return Result<std::string, Error>::Err(
                Error{"StdioRead", "End of input", ErrorCategory::EndOfStream});
        }
        if (token.IsCancelled()) {
            return Result<std::string, Error>::Err(
                Error{"StdioRead", "Read cancelled", ErrorCategory::Cancelled});
        }
        state_->cv.wait_for(lock, kPollInterval);
    }
}

Result<void, Error> StdioTransport::Write(std::string_view message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << message << '\n';
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(
            Error{"StdioWrite", "Output stream failed", ErrorCategory::Transport});
    }
    return Result<void, Error>::Ok();
}

void StdioTransport::Close() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->closed = true;
    state_->cv.notify_all();
}

} // namespace cowgnition
