/************************************************************************/
/*                                                                      */
/*    lrvutil - convert EAC 360 degree video to dual fisheye LRV layout */
/*                                                                      */
/*            Copyright 2024 by Kay F. Jahnke                           */
/*                                                                      */
/*    The git repository for this software is at                        */
/*                                                                      */
/*    https://github.com/kfjahnke/envutil                               */
/*                                                                      */
/*    Please direct questions, bug reports, and contributions to        */
/*                                                                      */
/*    kfjahnke+envutil@gmail.com                                        */
/*                                                                      */
/*    Permission is hereby granted, free of charge, to any person       */
/*    obtaining a copy of this software and associated documentation    */
/*    files (the "Software"), to deal in the Software without           */
/*    restriction, including without limitation the rights to use,      */
/*    copy, modify, merge, publish, distribute, sublicense, and/or      */
/*    sell copies of the Software, and to permit persons to whom the    */
/*    Software is furnished to do so, subject to the following          */
/*    conditions:                                                       */
/*                                                                      */
/*    The above copyright notice and this permission notice shall be    */
/*    included in all copies or substantial portions of the             */
/*    Software.                                                         */
/*                                                                      */
/*    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND    */
/*    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES   */
/*    OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND          */
/*    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT       */
/*    HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,      */
/*    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING      */
/*    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR     */
/*    OTHER DEALINGS IN THE SOFTWARE.                                   */
/*                                                                      */
/************************************************************************/

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <OpenImageIO/filesystem.h>

#include "lrvutil_basic.h"
#include "subprocess.h"

using namespace std::chrono_literals ;

namespace lrvutil
{

scoped_process::scoped_process ( const std::vector < std::string > & argv )
{
  if ( argv.empty() )
    throw error ( ENGINE_FAILED , "no engine command given" ) ;

  // the child's stderr goes to a fresh temporary file. The descriptor
  // is close-on-exec, so an engine forked concurrently by another
  // worker doesn't inherit it.

  std::string model = OIIO::Filesystem::temp_directory_path()
                      + "/lrvutil_stderr_XXXXXX" ;
  std::vector < char > path ( model.begin() , model.end() ) ;
  path.push_back ( 0 ) ;

  int err_fd = mkostemp ( path.data() , O_CLOEXEC ) ;
  if ( err_fd < 0 )
  {
    throw error ( IO_FAILED ,
                  std::string ( "can't create stderr capture file: " )
                  + std::strerror ( errno ) ) ;
  }
  stderr_path = path.data() ;

  // everything the child needs is prepared before the fork: after it,
  // the child may only use async-signal-safe calls.

  std::vector < char * > cargv ;
  for ( const auto & a : argv )
    cargv.push_back ( const_cast < char * > ( a.c_str() ) ) ;
  cargv.push_back ( nullptr ) ;

  std::string exec_failed = "lrvutil: can't execute " + argv[0] + "\n" ;

#ifdef __linux__
  pid_t parent = getpid() ;
#endif

  child = fork() ;

  if ( child == 0 )
  {
    setpgid ( 0 , 0 ) ;

#ifdef __linux__
    // the engine sits in its own process group, so a signal which
    // kills lrvutil outright won't reach it. Have the kernel kill it
    // when the parent goes away.

    prctl ( PR_SET_PDEATHSIG , SIGKILL ) ;
    if ( getppid() != parent )
      _exit ( 127 ) ;
#endif

    int null_fd = open ( "/dev/null" , O_RDWR | O_CLOEXEC ) ;
    if ( null_fd >= 0 )
    {
      dup2 ( null_fd , STDIN_FILENO ) ;
      dup2 ( null_fd , STDOUT_FILENO ) ;
    }
    dup2 ( err_fd , STDERR_FILENO ) ;
    execvp ( cargv[0] , cargv.data() ) ;
    ssize_t written = write ( STDERR_FILENO ,
                              exec_failed.data() ,
                              exec_failed.size() ) ;
    (void) written ;
    _exit ( 127 ) ;
  }

  int fork_errno = errno ;
  close ( err_fd ) ;

  if ( child < 0 )
  {
    std::string err ;
    OIIO::Filesystem::remove ( stderr_path , err ) ;
    throw error ( ENGINE_FAILED ,
                  std::string ( "can't spawn engine process: " )
                  + std::strerror ( fork_errno ) ) ;
  }

  // the parent sets the group as well, so a terminate() right after
  // the fork can't miss it

  setpgid ( child , child ) ;
}

scoped_process::~scoped_process()
{
  if ( child > 0 && ! reaped )
    terminate() ;

  if ( ! stderr_path.empty() )
  {
    std::string err ;
    OIIO::Filesystem::remove ( stderr_path , err ) ;
  }
}

void scoped_process::terminate()
{
  // ask nicely first, then kill the whole group

  kill ( - child , SIGTERM ) ;

  for ( int i = 0 ; i < 20 ; i++ )
  {
    pid_t r = waitpid ( child , &raw_status , WNOHANG ) ;
    if ( r == child || ( r < 0 && errno != EINTR ) )
    {
      reaped = true ;
      break ;
    }
    std::this_thread::sleep_for ( 50ms ) ;
  }

  // stragglers in the group (children of the engine) go as well

  kill ( - child , SIGKILL ) ;

  if ( ! reaped )
  {
    while ( waitpid ( child , &raw_status , 0 ) < 0 && errno == EINTR )
      ;
    reaped = true ;
  }
}

std::string scoped_process::stderr_tail() const
{
  std::string text ;
  if ( ! OIIO::Filesystem::read_text_file ( stderr_path , text ) )
    return text ;

  if ( text.size() > tail_size )
  {
    text = text.substr ( text.size() - tail_size ) ;

    // don't start in the middle of a line

    auto nl = text.find ( '\n' ) ;
    if ( nl != std::string::npos && nl + 1 < text.size() )
      text = text.substr ( nl + 1 ) ;
  }

  while ( ! text.empty() && ( text.back() == '\n' || text.back() == '\r' ) )
    text.pop_back() ;

  return text ;
}

process_outcome_t scoped_process::wait ( double timeout ,
                                         const cancel_token_t * cancel )
{
  process_outcome_t outcome ;
  auto start = LRVUTIL_NOW() ;

  while ( ! reaped )
  {
    pid_t r = waitpid ( child , &raw_status , WNOHANG ) ;

    if ( r == child )
    {
      reaped = true ;
      break ;
    }

    if ( r < 0 && errno != EINTR )
    {
      throw error ( ENGINE_FAILED ,
                    std::string ( "lost track of engine process: " )
                    + std::strerror ( errno ) ) ;
    }

    if ( cancel && cancel->cancelled() )
    {
      terminate() ;
      outcome.status = PROCESS_CANCELLED ;
      break ;
    }

    if (    timeout > 0.0
         && seconds_between ( start , LRVUTIL_NOW() ) >= timeout )
    {
      terminate() ;
      outcome.status = PROCESS_TIMED_OUT ;
      break ;
    }

    std::this_thread::sleep_for ( 20ms ) ;
  }

  if ( WIFEXITED ( raw_status ) )
    outcome.exit_code = WEXITSTATUS ( raw_status ) ;
  else if ( WIFSIGNALED ( raw_status ) )
    outcome.exit_code = 128 + WTERMSIG ( raw_status ) ;

  outcome.stderr_tail = stderr_tail() ;
  return outcome ;
}

} ; // namespace lrvutil
