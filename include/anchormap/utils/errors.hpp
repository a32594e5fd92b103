#ifndef ANCHORMAP_ERRORS_HPP
#define ANCHORMAP_ERRORS_HPP

#include "macros.hpp"

#include <stdexcept>
#include <string>
#include <utility>

/**
 * @file errors.hpp
 *
 * @brief Exception classes thrown by **libanchormap**.
 */

namespace anchormap {

/**
 * @brief Base class for all errors thrown by **libanchormap**.
 *
 * Each error carries a message and, once it has passed through one of the orchestrating classes (e.g., `FindTransferAnchors`), the name of the stage where it occurred.
 * The stage is prepended to the message returned by `what()`.
 */
class Error : public std::runtime_error {
public:
    /**
     * @param message Description of the error.
     * @param stage Name of the stage that failed, if known.
     */
    Error(std::string message, std::string stage = "") :
        std::runtime_error(stage.empty() ? message : stage + ": " + message),
        msg(std::move(message)),
        stg(std::move(stage))
    {}

    /**
     * @return Description of the error, without the stage.
     */
    const std::string& message() const {
        return msg;
    }

    /**
     * @return Name of the stage that failed, or an empty string if this is not known.
     */
    const std::string& stage() const {
        return stg;
    }

private:
    std::string msg, stg;
};

/**
 * @brief Invalid parameter setting.
 *
 * These errors are raised before any computation is performed.
 */
class ValidationError : public Error {
public:
    /**
     * @param parameter Name of the offending parameter.
     * @param detail Description of the problem.
     * @param stage Name of the stage that failed, if known.
     */
    ValidationError(std::string parameter, std::string detail, std::string stage = "") :
        Error("invalid '" + parameter + "': " + detail, std::move(stage)),
        param(std::move(parameter)),
        det(std::move(detail))
    {}

    /**
     * @return Name of the offending parameter.
     */
    const std::string& parameter() const {
        return param;
    }

    /**
     * @return Description of the problem, without the parameter name or stage.
     */
    const std::string& detail() const {
        return det;
    }

private:
    std::string param, det;
};

/**
 * @brief Problem with the input data, e.g., mismatched lengths or an empty anchor set.
 */
class DataError : public Error {
public:
    /**
     * @param message Description of the problem.
     * @param stage Name of the stage that failed, if known.
     */
    DataError(std::string message, std::string stage = "") : Error(std::move(message), std::move(stage)) {}
};

/**
 * @brief Computation was cancelled through a `CancellationToken`.
 */
class CancelledError : public Error {
public:
    /**
     * @param stage Name of the stage that was about to start.
     */
    CancelledError(std::string stage) : Error("computation was cancelled", std::move(stage)) {}
};

/**
 * Run a stage of a larger pipeline, attaching the stage name to any **libanchormap** errors that do not already have one.
 * All other exceptions are propagated unchanged.
 *
 * @tparam Function_ Function that accepts no arguments.
 *
 * @param stage Name of the stage.
 * @param fun Function to execute.
 *
 * @return The return value of `fun`.
 */
template<class Function_>
auto run_stage(const std::string& stage, Function_ fun) -> decltype(fun()) {
    try {
        return fun();
    } catch (ValidationError& e) {
        if (!e.stage().empty()) {
            throw;
        }
        throw ValidationError(e.parameter(), e.detail(), stage);
    } catch (DataError& e) {
        if (!e.stage().empty()) {
            throw;
        }
        throw DataError(e.message(), stage);
    }
}

}

#endif
