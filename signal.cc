#include <signal.h>
#include "common.hh"
#include "signal.hh"



// 0: not intercepted, 1: interrupted, 2: engaged
static volatile sig_atomic_t g_sigint_flag = 0;



namespace ccd2iso
{

InterruptGuard::InterruptGuard()
	: _installed(false)
{
	auto old_handler = signal(SIGINT, Handler);
	if(old_handler == SIG_ERR)
		throw_line("unable to set signal handler (signal: {})", SIGINT);

	// ignored signal stays ignored (background process)
	if(old_handler == SIG_IGN)
	{
		signal(SIGINT, SIG_IGN);
		return;
	}
	else if(old_handler != SIG_DFL)
	{
		signal(SIGINT, old_handler);
		throw_line("signal handler already set (signal: {})", SIGINT);
	}

	_installed = true;
	g_sigint_flag = 2;
}


InterruptGuard::~InterruptGuard()
{
	if(!_installed)
		return;

	g_sigint_flag = 0;
	signal(SIGINT, SIG_DFL);
}


bool InterruptGuard::Interrupted() const
{
	return g_sigint_flag == 1;
}


void InterruptGuard::Handler(int sig)
{
	if(!g_sigint_flag)
	{
		signal(sig, SIG_DFL);
		raise(sig);
	}
	else if(g_sigint_flag == 2)
		g_sigint_flag = 1;
}

}
