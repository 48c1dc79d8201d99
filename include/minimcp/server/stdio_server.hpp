#pragma once
#include <atomic>
#include <functional>
#include <iostream>
#include <string>

namespace minimcp::server
{

/**
 * Line-delimited server loop.
 *
 * Reads one request line at a time from an input stream, hands it to the
 * line handler and writes the returned reply, newline-terminated and flushed,
 * to the output stream. One request is processed to completion before the
 * next line is read.
 *
 * Usage:
 *   minimcp::server::Registry registry;
 *   minimcp::mcp::Dispatcher dispatcher(registry);
 *   StdioServerWrapper server(minimcp::mcp::make_line_handler(dispatcher));
 *   server.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    using LineHandler = std::function<std::string(const std::string&)>;

    /**
     * @param handler Maps one request line to one reply line (no trailing newline).
     * @param in      Request stream, std::cin by default.
     * @param out     Reply stream, std::cout by default.
     */
    explicit StdioServerWrapper(LineHandler handler, std::istream& in = std::cin,
                                std::ostream& out = std::cout);

    /**
     * Run the loop (blocking).
     *
     * Returns when the input stream ends or after stop() is observed between
     * two requests. Blank lines are skipped.
     *
     * @return false if the loop was already running, true otherwise
     */
    bool run();

    /// Request the loop to exit before reading the next line. Safe to call
    /// from a handler or repeatedly.
    void stop();

    bool running() const
    {
        return running_.load();
    }

  private:
    void run_loop();

    LineHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace minimcp::server
