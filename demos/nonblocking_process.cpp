/**
 * This is the demo for non-blocking communication with a child process.
 * The child is a shell reading commands from its standard input.
 */
#include <libsafix/file_desc.hpp>
#include <libsafix/poll.hpp>
#include <libsafix/spawn.hpp>
#include <libsafix/unistd.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
bool send_line(sfx::file_desc& fd, std::string const& line)
{
	auto r = fd.write_all(line.data(), line.size());
	if (!r) {
		std::cerr << "Sending data to the process failed: " << sfx::to_string(r) << std::endl;
	}
	return bool(r);
}
}

int main()
{
	sfx::file_desc to_child_r, to_child_w;
	sfx::file_desc from_child_r, from_child_w;
	if (!sfx::pipe_cloexec(to_child_r, to_child_w) || !sfx::pipe_cloexec(from_child_r, from_child_w)) {
		std::cerr << "Could not create pipes" << std::endl;
		return 1;
	}

	sfx::spawn_file_actions actions;
	if (!actions.add_dup2(to_child_r.fd(), STDIN_FILENO) || !actions.add_dup2(from_child_w.fd(), STDOUT_FILENO)) {
		std::cerr << "Could not set up redirection" << std::endl;
		return 1;
	}

	sfx::cstring_vec argv{"sh"};
	pid_t pid{};
	auto r = sfx::spawnp(pid, "sh", &actions, nullptr, argv);
	if (!r) {
		std::cerr << "Could not spawn process: " << sfx::to_string(r) << std::endl;
		return 1;
	}
	std::cout << "Spawned process " << pid << std::endl;

	// Our copies of the child's ends, otherwise we never see EOF
	to_child_r.close();
	from_child_w.close();

	if (!from_child_r.set_nonblocking()) {
		std::cerr << "Could not make pipe non-blocking" << std::endl;
		return 1;
	}

	if (!send_line(to_child_w, "for i in 1 2 3 4 5 6; do if [ $i = 6 ]; then echo woof; else echo $i; fi; done\n")) {
		return 1;
	}

	std::cout << "Waiting on process to print woof..." << std::endl;

	std::string input;
	bool done{};
	bool eof{};
	while (!eof) {
		std::vector<pollfd> fds{sfx::make_pollfd(from_child_r.fd(), sfx::poll_event::in)};
		size_t ready{};
		r = sfx::poll(fds, -1, ready);
		if (!r) {
			if (r.error_ == sfx::result::interrupted) {
				continue;
			}
			std::cerr << "poll failed: " << sfx::to_string(r) << std::endl;
			return 1;
		}

		while (true) {
			char buf[100];
			sfx::rwresult rr = from_child_r.read(buf, 100);
			if (!rr) {
				if (rr.error_ == sfx::rwresult::wouldblock) {
					break;
				}
				std::cerr << "Could not read from process" << std::endl;
				return 1;
			}
			else if (!rr.value_) {
				if (!done) {
					std::cerr << "Unexpected EOF from process" << std::endl;
					return 1;
				}
				std::cerr << "Received the expected EOF from process" << std::endl;
				eof = true;
				break;
			}

			input += std::string(buf, rr.value_);

			// Extract complete lines from the input
			auto delim = input.find_first_of("\r\n");
			while (delim != std::string::npos) {
				std::string line = input.substr(0, delim);
				input = input.substr(delim + 1);
				delim = input.find_first_of("\r\n");

				if (!line.empty()) {
					std::cout << "Received line from process: " << line << std::endl;
					if (line == "woof" && !done) {
						done = true;

						if (!send_line(to_child_w, "exit 0\n")) {
							return 1;
						}
						std::cout << "Told process to quit." << std::endl;
					}
				}
			}
		}
	}

	int status{};
	r = sfx::wait_pid(pid, status);
	if (!r) {
		std::cerr << "Could not wait for process: " << sfx::to_string(r) << std::endl;
		return 1;
	}

	auto code = sfx::exit_status(status);
	if (!code) {
		std::cerr << "Process did not exit normally" << std::endl;
		return 1;
	}
	std::cout << "Process exited with code " << *code << std::endl;

	return *code;
}
