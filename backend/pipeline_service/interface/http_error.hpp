#pragma once
#include <boost/beast/http.hpp>
#include "domain/pipeline_error.hpp"

namespace pipeline_service {

inline boost::beast::http::status httpStatusFor(const PipelineError& error) {
  using boost::beast::http::status;
  switch (error.kind) {
    case ErrorKind::Validation:          return status::bad_request;
    case ErrorKind::NotFound:            return status::not_found;
    case ErrorKind::ConcurrencyConflict: return status::conflict;
    case ErrorKind::RangeNotSatisfiable: return status::range_not_satisfiable;
    default:                             return status::internal_server_error;
  }
}

}
