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


// lrv_batch converts all .360 files in a directory, running several
// engine instances in parallel. Each finished file is reported as it
// completes, followed by a summary. Ctrl-C, SIGTERM or SIGHUP stops
// the batch: running conversions are terminated and the summary lists
// them as cancelled.
// For the options, try 'lrv_batch --help'.

#include <iostream>
#include <sstream>

#include <OpenImageIO/argparse.h>
#include <OpenImageIO/strutil.h>

#include "arguments.h"
#include "batch.h"
#include "lrvutil_log.h"

using namespace lrvutil ;
using OIIO::ArgParse ;
using OIIO::Strutil::fmt::format ;

struct arguments
: public common_arguments
{
  std::string input_dir ;
  std::string output_dir ;
  bool add_masking = false ;
  int workers = 0 ;
  int retries = 0 ;

  void init ( int argc , const char ** argv ) ;
} ;

arguments args ;

void arguments::init ( int argc , const char ** argv )
{
  ArgParse ap;

  ap.intro("lrv_batch: convert a directory of .360 files to dual fisheye\n")
    .usage("lrv_batch [options...] INPUT_DIR OUTPUT_DIR");

  ap.arg("dirname")
    .hidden()
    .action(ArgParse::append());

  add_common ( ap ) ;

  ap.separator("  batch options:");

  ap.arg("--add-masking", &add_masking)
    .help("black out everything outside the two fisheye circles");

  ap.arg("--workers N")
    .help(format("parallel conversions (default: {}, at most {})",
                 default_worker_count(), max_workers))
    .metavar("N");

  ap.arg("--retries N")
    .help("extra attempts for conversions which failed (default: 0)")
    .metavar("N");

  parse_arguments ( ap , argc , argv ) ;

  auto dirs = positional ( ap , "dirname" , 2 , 2 ) ;
  input_dir = dirs[0] ;
  output_dir = dirs[1] ;

  glean_common ( ap , profile_by_name ( "balanced" ) ) ;

  workers = ap["workers"].get<int> ( 0 ) ;
  retries = ap["retries"].get<int> ( 0 ) ;

  if ( workers < 0 )
    throw usage_error ( "--workers must be at least 1" ) ;
  if ( retries < 0 )
    throw usage_error ( "--retries can't be negative" ) ;
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

  batch_options_t options ;
  options.profile = args.profile ;
  options.masking = args.add_masking ;
  options.workers = args.workers ;
  options.retries = args.retries ;

  print_banner
    ( "Batch conversion" ,
      { { "Input directory" , args.input_dir } ,
        { "Output directory" , args.output_dir } ,
        { "Encoding" , describe ( args.profile ) } ,
        { "Mode" , args.add_masking ? "projection + circular masking"
                                    : "projection" } } ) ;

  batch_scheduler scheduler ( args.runner_config() ) ;
  install_interrupt_handler ( scheduler.cancel_token() ) ;

  scheduler.on_progress
    ( [] ( const job_result_t & result , const batch_report_t & report )
      {
        std::ostringstream line ;
        line << "[" << report.results.size() << "/" << report.total << "] "
             << result ;
        log_info ( line.str() ) ;
      } ) ;

  batch_report_t report ;

  try
  {
    report = scheduler.run_batch ( args.input_dir , args.output_dir ,
                                   options ) ;
  }
  catch ( const error & e )
  {
    log_error ( std::string ( error_kind_name [ e.kind ] ) + ": " + e.what() ) ;
    return e.kind == INVALID_SPEC ? 2 : 1 ;
  }

  std::cout << std::endl << report ;

  if ( scheduler.cancelled() )
    log_warning ( "batch was interrupted" ) ;

  return report.all_succeeded() ? 0 : 1 ;
}
