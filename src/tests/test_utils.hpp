#ifndef FDFS_TEST_UTILS_HPP
#define FDFS_TEST_UTILS_HPP

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <random>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "protocol/types.hpp"

// Set logging severity level and configure logging
inline void init_logging() {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    // Warnings and above keep test output readable
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::warning
    );

    boost::log::add_common_attributes();
}

inline fdfs::protocol::Bytes random_bytes(std::size_t size, unsigned seed = 42) {
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    fdfs::protocol::Bytes data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(distribution(generator));
    }
    return data;
}

// Runs body as a coroutine on a fresh io_context until everything finishes.
// Exceptions escaping the coroutine are rethrown to the caller.
inline void run_coroutine(const std::function<void(boost::asio::io_context&, boost::asio::yield_context)>& body) {
    boost::asio::io_context io_context;
    std::exception_ptr failure;
    boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
        try {
            body(io_context, yield);
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    });
    io_context.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

#endif // FDFS_TEST_UTILS_HPP
