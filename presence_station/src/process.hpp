#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

/**
 * @brief Run a program and wait for it
 *
 * The program is looked up in PATH. Its output goes to /dev/null.
 * It is killed if it is still running after timeout_s seconds.
 *
 * @param args program name followed by its arguments
 * @param timeout_s
 * @return true if the program exited with status 0
 */
bool run_process(const std::vector<std::string> &args, unsigned int timeout_s);

#endif
