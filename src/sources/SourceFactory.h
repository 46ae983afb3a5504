#pragma once
#include "sources/IDataSource.h"
#include "config/config.h"
#include <memory>
#include <utility>
#include <boost/asio/any_io_executor.hpp>

// Throws ConfigurationError for an unknown type or invalid parameters.
std::unique_ptr<IDataSource> create_source(const LoopConfig& cfg, const boost::asio::any_io_executor& ex);
