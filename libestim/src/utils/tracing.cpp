#include "libestim/utils/tracing.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace libestim {
namespace utils {

// Release builds: default to WARN (suppress INFO messages)
// Debug builds: default to INFO
#ifdef NDEBUG
static constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
static constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

std::atomic<LogLevel> Tracer::current_level_ {kDefaultLevel};
std::atomic<bool> Tracer::initialized_ {false};
std::ostream *Tracer::sink_ = nullptr;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;

namespace {

// __FILE__ without its directories
std::string BaseName(const std::string &path) {
	const size_t pos = path.find_last_of("/\\");
	return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

void Tracer::WriteLine(LogLevel level, const std::string &body) {
	const std::string stamp = GetTimestamp();
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::ostream &out = sink_ != nullptr ? *sink_ : std::cerr;
	out << "[" << stamp << "] [libestim/" << GetLevelName(level) << "] " << body << '\n';
}

void Tracer::Initialize() {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	if (initialized_) {
		return;
	}

	const char *env_level = std::getenv("LIBESTIM_LOG_LEVEL");
	current_level_ = env_level == nullptr ? kDefaultLevel : ParseLevel(env_level, kDefaultLevel);
	initialized_ = true;
}

void Tracer::SetLogLevel(LogLevel level) {
	current_level_ = level;
	initialized_ = true;
}

LogLevel Tracer::GetLogLevel() {
	if (!initialized_) {
		Initialize();
	}
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	if (!initialized_) {
		Initialize();
	}
	return level >= current_level_ && level != LogLevel::NONE;
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string level_str = name;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		return LogLevel::TRACE;
	} else if (level_str == "debug") {
		return LogLevel::DBG;
	} else if (level_str == "info") {
		return LogLevel::INFO;
	} else if (level_str == "warn") {
		return LogLevel::WARN;
	} else if (level_str == "error") {
		return LogLevel::ERR;
	} else if (level_str == "none") {
		return LogLevel::NONE;
	}
	return fallback;
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	using std::chrono::system_clock;
	const system_clock::time_point now = system_clock::now();
	const std::time_t seconds = system_clock::to_time_t(now);
	const auto millis =
	    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::tm local_tm {};
	localtime_r(&seconds, &local_tm);

	std::ostringstream stamp;
	stamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis;
	return stamp.str();
}

void Tracer::SetSink(std::ostream *sink) {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	sink_ = sink;
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::ostringstream location;
	location << BaseName(file) << ":" << line << " - ";
	WriteLine(level, location.str() + message);
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}
	WriteLine(level, message);
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
	                                 std::chrono::steady_clock::now().time_since_epoch())
	                                 .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	const double elapsed_ms = static_cast<double>(TimingStart() - handle) / 1e6;

	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream msg;
		msg << operation_name << " completed in " << std::fixed << std::setprecision(2) << elapsed_ms << " ms";
		LogDirect(LogLevel::DBG, msg.str());
	}
	return elapsed_ms;
}

} // namespace utils
} // namespace libestim
