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


// lrv_convert converts one EAC 360 degree video into the dual fisheye
// layout of the camera's low-resolution preview (1408x704, two 190
// degree circles looking left and right), optionally followed by the
// circular masking pass. For the options, try 'lrv_convert --help'.

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
  bool add_masking = false ;
  projection_spec_t projection ;

  void init ( int argc , const char ** argv ) ;
} ;

arguments args ;

void arguments::init ( int argc , const char ** argv )
{
  ArgParse ap;

  ap.intro("lrv_convert: convert EAC 360 video to dual fisheye LRV layout\n")
    .usage("lrv_convert [options...] INPUT OUTPUT");

  ap.arg("filename")
    .hidden()
    .action(ArgParse::append());

  add_common ( ap ) ;

  ap.separator("  conversion options:");

  ap.arg("--add-masking", &add_masking)
    .help("black out everything outside the two fisheye circles");

  ap.separator("  custom geometry (default: match the LRV layout):");

  ap.arg("--eye_size EXTENT")
    .help("width and height of each eye (default: 704)")
    .metavar("EXTENT");

  ap.arg("--fov ANGLE")
    .help("field of view of each eye (default: 190)")
    .metavar("ANGLE");

  ap.arg("--equirect_width EXTENT")
    .help("width of the intermediate equirect (default: 3840)")
    .metavar("EXTENT");

  parse_arguments ( ap , argc , argv ) ;

  auto files = positional ( ap , "filename" , 2 , 2 ) ;
  input = files[0] ;
  output = files[1] ;

  glean_common ( ap , profile_by_name ( "balanced" ) ) ;

  int eye_size = ap["eye_size"].get<int> ( 0 ) ;
  float fov = ap["fov"].get<float> ( 0.0f ) ;
  int equirect_width = ap["equirect_width"].get<int> ( 0 ) ;

  projection = lrv_match_spec() ;

  try
  {
    if ( eye_size || fov != 0.0f || equirect_width )
      projection = custom_spec
        ( eye_size ? eye_size : projection.eye_height() ,
          fov != 0.0f ? fov : projection.h_fov ,
          equirect_width ? equirect_width : projection.equirect_width ) ;
  }
  catch ( const error & e )
  {
    throw usage_error ( e.what() ) ;
  }
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
    ( "EAC 360 to dual fisheye conversion" ,
      { { "Input" , args.input } ,
        { "Output" , args.output } ,
        { "Encoding" , describe ( args.profile ) } ,
        { "Frame size" , format ( "{}x{}" , args.projection.output_width ,
                                  args.projection.output_height ) } ,
        { "Mode" , args.add_masking ? "projection + circular masking"
                                    : "projection" } } ) ;

  if ( ! has_360_extension ( args.input ) )
    log_warning ( args.input + " doesn't have the .360 extension, "
                  "converting it anyway" ) ;

  if ( is_verbose() )
  {
    std::ostringstream prj ;
    prj << args.projection ;
    log_debug ( prj.str() ) ;
  }

  conversion_job_t job ;
  job.source = args.input ;
  job.destination = args.output ;
  job.projection = args.projection ;
  job.profile = args.profile ;
  job.masking = args.add_masking ;

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
