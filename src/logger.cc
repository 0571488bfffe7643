#include <ctime>
#include <parexec/errmsg.hh>
#include <parexec/logger.hh>
#include <parexec/macros/throw.hh>

using std::string;

namespace {

// Returns false if the time could not be formatted
bool local_datetime(char (&buff)[32]) noexcept {
    time_t now = time(nullptr);
    struct tm tm = {};
    if (localtime_r(&now, &tm) == nullptr) {
        return false;
    }
    return strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &tm) != 0;
}

} // namespace

Logger::Logger(const string& filename) : f_(fopen(filename.c_str(), "ae")) {
    if (f_ == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    opened_ = true;
}

void Logger::open(const string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }

    close();
    f_ = f;
    opened_ = true;
}

void Logger::Appender::flush_impl() noexcept {
    if (flushed_) {
        return;
    }

    if (logger_.lock()) {
        if (label_) {
            char datetime[32];
            (void)fprintf(
                logger_.f_,
                "[ %s ] %.*s\n",
                local_datetime(datetime) ? datetime : "unknown time",
                static_cast<int>(buff_.size()),
                buff_.data()
            );
        } else {
            (void)fprintf(logger_.f_, "%.*s\n", static_cast<int>(buff_.size()), buff_.data());
        }

        (void)fflush(logger_.f_);
        logger_.unlock();
    }

    flushed_ = true;
    buff_.clear();
}
