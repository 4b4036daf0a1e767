#include "retrykit/core/util/error_types.hpp"

namespace retrykit {

    namespace {

        // Rethrows err and walks std::nested_exception links until an E is
        // caught. fn runs inside the handler, while the object is alive.
        template<typename E, typename Fn>
        bool visitChain(std::exception_ptr err, Fn&& fn) {
            while (err) {
                try {
                    std::rethrow_exception(err);
                }
                catch (const E& e) {
                    fn(e);
                    return true;
                }
                catch (const std::nested_exception& n) {
                    err = n.nested_ptr();
                }
                catch (...) {
                    return false;
                }
            }
            return false;
        }

        template<typename E>
        bool holds(const std::exception_ptr& err) {
            return visitChain<E>(err, [](const E&) {});
        }

        template<typename E>
        bool holds(const std::exception& e) {
            if (dynamic_cast<const E*>(&e)) return true;
            if (auto n = dynamic_cast<const std::nested_exception*>(&e))
                return holds<E>(n->nested_ptr());
            return false;
        }

    }

    const char* retryErrName(RetryErr code) {
        switch (code) {
        case RetryErr::InvalidConfiguration: return "InvalidConfiguration";
        case RetryErr::AttemptsExceeded:     return "AttemptsExceeded";
        case RetryErr::RetryStopped:         return "RetryStopped";
        }
        return "Unknown";
    }

    AttemptsExceeded::AttemptsExceeded(std::exception_ptr lastError)
        : RetryError(RetryErr::AttemptsExceeded,
                     "attempt count exceeded: " + describeError(lastError)),
          lastError_(std::move(lastError)) {}

    RetryStopped::RetryStopped(std::exception_ptr lastError)
        : RetryError(RetryErr::RetryStopped,
                     "retry stopped: " + describeError(lastError)),
          lastError_(std::move(lastError)) {}

    std::string describeError(const std::exception_ptr& err) {
        if (!err) return "no error";
        try {
            std::rethrow_exception(err);
        }
        catch (const std::exception& e) {
            return e.what();
        }
        catch (...) {
            return "unknown error";
        }
    }

    std::exception_ptr lastErrorOf(const std::exception_ptr& err) {
        std::exception_ptr cause;
        if (visitChain<AttemptsExceeded>(err, [&](const AttemptsExceeded& e) { cause = e.lastError(); }))
            return cause;
        if (visitChain<RetryStopped>(err, [&](const RetryStopped& e) { cause = e.lastError(); }))
            return cause;
        return err;
    }

    bool isAttemptsExceeded(const std::exception& e) { return holds<AttemptsExceeded>(e); }
    bool isAttemptsExceeded(const std::exception_ptr& err) { return holds<AttemptsExceeded>(err); }

    bool isRetryStopped(const std::exception& e) { return holds<RetryStopped>(e); }
    bool isRetryStopped(const std::exception_ptr& err) { return holds<RetryStopped>(err); }

    bool isInvalidConfiguration(const std::exception& e) { return holds<InvalidConfiguration>(e); }
    bool isInvalidConfiguration(const std::exception_ptr& err) { return holds<InvalidConfiguration>(err); }

}
