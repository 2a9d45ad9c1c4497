// RAII wrapper for file descriptors (pipe ends, device handles).
#ifndef MPATHPR_SRC_COMMON_SCOPED_FD_H_
#define MPATHPR_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace MpathPr {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Close now; used on the child side of fork before exec.
	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

} // namespace MpathPr

#endif  // MPATHPR_SRC_COMMON_SCOPED_FD_H_
