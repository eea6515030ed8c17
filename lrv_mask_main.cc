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


// lrv_mask applies the circular mask to a video which is in dual
// fisheye layout already: everything outside the two circles is set
// to black. With --test, only the first seconds are processed, to
// check the result quickly. For the options, try 'lrv_mask --help'.

#include <sstream>

#include <OpenImageIO/argparse.h>
#include <OpenImageIO/strutil.h>

#include "arguments.h"
#include "batch.h"
#include "job_runner.h"
#include "lrvutil_log.h"

using namespace lrvutil ;
using OIIO::ArgParse ;
using OIIO::Strutil::fmt::format ;

struct arguments
: public common_arguments
{
  std::string input ;
  std::string output ;
  bool test = false ;
  double test_seconds = 30.0 ;

  void init ( int argc , const char ** argv ) ;
} ;

arguments args ;

void arguments::init ( int argc , const char ** argv )
{
  ArgParse ap;

  ap.intro("lrv_mask: black out the area outside the fisheye circles\n")
    .usage("lrv_mask [options...] INPUT [OUTPUT]");

  ap.arg("filename")
    .hidden()
    .action(ArgParse::append());

  add_common ( ap ) ;

  ap.separator("  masking options:");

  ap.arg("--test", &test)
    .help("only process the first seconds of the video");

  ap.arg("--test_seconds SECONDS")
    .help("duration processed with --test (default: 30)")
    .metavar("SECONDS");

  parse_arguments ( ap , argc , argv ) ;

  auto files = positional ( ap , "filename" , 1 , 2 ) ;
  input = files[0] ;
  output = files.size() == 2 ? files[1]
                             : masked_destination_for ( input , test ) ;

  glean_common ( ap , make_profile ( "fast" , 23 ) ) ;

  test_seconds = ap["test_seconds"].get<float> ( 30.0f ) ;
  if ( test_seconds <= 0.0 )
    throw usage_error ( "--test_seconds must be positive" ) ;
}

int main ( int argc , const char ** argv )
{
  try
  {
    args.init ( argc , argv ) ;
  }
  catch ( const usage_error & e )
  {
    log_error ( e.what() ) ;
    return 2 ;
  }

  print_banner
    ( "Circular masking" ,
      { { "Input" , args.input } ,
        { "Output" , args.output } ,
        { "Encoding" , describe ( args.profile ) } ,
        { "Mode" , args.test ? format ( "test, first {}s" , args.test_seconds )
                             : std::string ( "full video" ) } } ) ;

  conversion_job_t job ;
  job.source = args.input ;
  job.destination = args.output ;
  job.profile = args.profile ;
  job.mask_only = true ;
  job.duration_limit = args.test ? args.test_seconds : 0.0 ;

  cancel_token_t token ;
  install_interrupt_handler ( token ) ;

  job_runner runner ( args.runner_config() ) ;
  auto result = runner.run ( job , &token ) ;

  std::ostringstream line ;
  line << result ;

  if ( ! result.succeeded() )
  {
    log_error ( line.str() ) ;
    for ( const auto & finding : result.findings )
      log_error ( "  " + finding ) ;
    return 1 ;
  }

  log_info ( line.str() ) ;
  log_info ( format ( "Output size: {:.1f} MB" ,
                      result.output_size / ( 1024.0 * 1024.0 ) ) ) ;
  return 0 ;
}
