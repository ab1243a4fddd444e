#pragma once

/// @file errors.hpp
/// Exception types thrown across the kibitz API.

#include <stdexcept>
#include <string>

namespace kibitz {

/// Malformed or impossible board state. Raised at the rules boundary before
/// anything is evaluated.
class InvalidPosition : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/// Move text that does not parse, or a move that is not legal in the position.
class IllegalMove : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
};

/// A model artifact could not be loaded. Only the loader throws this; the
/// learned evaluator turns it into "model unavailable".
class ModelError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// Feature count, names or order of a model disagree with the extractor.
class FeatureSchemaMismatch : public ModelError {
   public:
    using ModelError::ModelError;
};

}  // namespace kibitz
