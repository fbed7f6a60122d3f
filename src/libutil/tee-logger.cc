#include "arbor/util/logging.hh"

namespace arbor {

class TeeLogger : public Logger
{
    std::unique_ptr<Logger> main;
    std::vector<std::unique_ptr<Logger>> extra;

    template<typename F>
    void each(F && f)
    {
        f(*main);
        for (auto & l : extra)
            f(*l);
    }

public:

    TeeLogger(std::unique_ptr<Logger> main, std::vector<std::unique_ptr<Logger>> && extra)
        : main(std::move(main))
        , extra(std::move(extra))
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        each([&](Logger & l) { l.log(lvl, s); });
    }

    void logEI(const ErrorInfo & ei) override
    {
        each([&](Logger & l) { l.logEI(ei); });
    }

    void warn(const std::string & msg) override
    {
        each([&](Logger & l) { l.warn(msg); });
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        each([&](Logger & l) { l.startActivity(act, lvl, type, s, fields, parent); });
    }

    void stopActivity(ActivityId act) override
    {
        each([&](Logger & l) { l.stopActivity(act); });
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        each([&](Logger & l) { l.result(act, type, fields); });
    }

    void writeToStdout(std::string_view s) override
    {
        main->writeToStdout(s);
    }
};

std::unique_ptr<Logger>
makeTeeLogger(std::unique_ptr<Logger> mainLogger, std::vector<std::unique_ptr<Logger>> && extraLoggers)
{
    return std::make_unique<TeeLogger>(std::move(mainLogger), std::move(extraLoggers));
}

} // namespace arbor
