/**@file Subprocess.hpp
 * @date 20261018 09:12:40 */

#ifndef __SUBPROCESS_HPP__
#define __SUBPROCESS_HPP__

#include <string>
#include <vector>

namespace pcmsink {

/**@brief Runs an external program and waits for it with a deadline*/
class Subprocess
{
public:
	struct Result
	{
		Result()
			: started(false)
			, timed_out(false)
			, exit_code(-1)
			, signal(0)
		{
		}
		bool Succeeded() const
		{
			return started && !timed_out && signal == 0 && exit_code == 0;
		}
		bool        started;
		bool        timed_out;
		int         exit_code;   //!< 127 if exec failed
		int         signal;      //!< terminating signal, 0 if exited
		std::string output;      //!< merged stdout/stderr, truncated
	};

	static Result Run(const std::vector<std::string>& argv,
	                  unsigned timeout_sec);

	static const size_t MAX_OUTPUT = 64*1024;

private:
	Subprocess() = delete;
};

} // namespace

#endif // __SUBPROCESS_HPP__
