#pragma once



namespace ccd2iso
{

// intercepts SIGINT for the lifetime of the object, the first signal
// is recorded instead of terminating the process
class InterruptGuard
{
public:
	InterruptGuard();
	~InterruptGuard();

	bool Interrupted() const;

	InterruptGuard(InterruptGuard const &) = delete;
	void operator=(InterruptGuard const &) = delete;

private:
	bool _installed;

	static void Handler(int sig);
};

}
