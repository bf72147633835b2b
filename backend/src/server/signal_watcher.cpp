#include "signal_watcher.hpp"

#include <iostream>

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Handler handler)
    : signals_(ioc_), handler_(std::move(handler))
{
    for (int s : signals)
        signals_.add(s);
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        std::cout << "[signal] " << signo << " received" << std::endl;
        if (handler_)
            handler_(signo);
    });
    thread_ = std::thread([this] { ioc_.run(); });
}

SignalWatcher::~SignalWatcher()
{
    ioc_.stop();
    if (thread_.joinable())
        thread_.join();
}
