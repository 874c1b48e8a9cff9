#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace telechart
{

// Base class for every error the library raises on its own behalf.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Empty or degenerate scale domain (e.g. a log scale with a non-positive bound).
class InvalidDomainError : public Error
{
   public:
    using Error::Error;
};

// A ScaleSpec named a kind that does not exist.
class UnsupportedScaleKindError : public Error
{
   public:
    explicit UnsupportedScaleKindError(const std::string& kind)
        : Error("Unsupported scale kind: '" + kind + "'"), kind_(kind)
    {
    }

    const std::string& kind() const { return kind_; }

   private:
    std::string kind_;
};

// A dynamic threshold cannot be computed from the samples available.
// Non-fatal: the evaluator resolves it with a fallback.
class InsufficientDataError : public Error
{
   public:
    InsufficientDataError(std::size_t available, std::size_t required)
        : Error("Insufficient data (" + std::to_string(available) + " < "
                + std::to_string(required) + ")"),
          available_(available),
          required_(required)
    {
    }

    std::size_t available() const { return available_; }
    std::size_t required() const { return required_; }

   private:
    std::size_t available_;
    std::size_t required_;
};

// A pipeline step threw.  Recorded by the pipeline, never rethrown.
class TransformStepError : public Error
{
   public:
    TransformStepError(const std::string& step_name, const std::string& cause)
        : Error("Transform step '" + step_name + "' failed: " + cause),
          step_name_(step_name),
          cause_(cause)
    {
    }

    const std::string& step_name() const { return step_name_; }
    const std::string& cause() const { return cause_; }

   private:
    std::string step_name_;
    std::string cause_;
};

}   // namespace telechart
