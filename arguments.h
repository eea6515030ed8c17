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


// command line arguments. We use OpenImageIO's ArgParse object, since
// we're using OIIO anyway. The three tools share the encoder and
// engine options; each tool derives its own 'arguments' struct
// from common_arguments, adds its specific options and gleans the
// results into member variables. If the arguments aren't acceptable,
// init throws a usage_error, which the tools report with exit code 2.

#ifndef LRVUTIL_ARGUMENTS_H
#define LRVUTIL_ARGUMENTS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <OpenImageIO/argparse.h>

#include "common.h"
#include "job_runner.h"
#include "lrvutil_basic.h"

namespace lrvutil
{

class usage_error
: public std::runtime_error
{
public:

  explicit usage_error ( const std::string & what )
  : std::runtime_error ( what )
  { }
} ;

struct common_arguments
{
  bool verbose = false ;
  encoding_profile_t profile ;
  std::string engine ;
  double timeout = 0.0 ;

  // register the shared options with the argument parser

  void add_common ( OIIO::ArgParse & ap ) ;

  // glean the shared options after parsing. A named --profile sets
  // preset and CRF; --preset and --quality override one of the two.

  void glean_common ( OIIO::ArgParse & ap ,
                      const encoding_profile_t & default_profile ) ;

  runner_config_t runner_config() const ;
} ;

// run the parser. On a parse error, print the error and the help text
// and throw usage_error.

void parse_arguments ( OIIO::ArgParse & ap , int argc , const char ** argv ) ;

// the positional arguments collected under 'name', with between 'least'
// and 'most' entries

std::vector < std::string > positional ( OIIO::ArgParse & ap ,
                                         const std::string & name ,
                                         std::size_t least ,
                                         std::size_t most ) ;

typedef std::vector < std::pair < std::string , std::string > > banner_t ;

// the settings block printed before the work starts

void print_banner ( const std::string & title , const banner_t & rows ) ;

std::string describe ( const encoding_profile_t & profile ) ;

// the first SIGINT, SIGTERM or SIGHUP cancels 'token', which
// terminates the engine runs in flight; a second one ends the program
// the usual way. 'token' must outlive the handler, or be released
// with remove_interrupt_handler().

void install_interrupt_handler ( cancel_token_t & token ) ;

void remove_interrupt_handler() ;

} ; // namespace lrvutil

#endif // LRVUTIL_ARGUMENTS_H
