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


#include <algorithm>
#include <csignal>
#include <iostream>

#include <OpenImageIO/filesystem.h>
#include <OpenImageIO/strutil.h>

#include "arguments.h"
#include "lrvutil_log.h"

namespace lrvutil
{

using OIIO::ArgParse ;
using OIIO::Strutil::fmt::format ;

namespace
{
  cancel_token_t * interrupt_token = nullptr ;

  // SIGINT from the terminal, SIGTERM from kill, SIGHUP when the
  // terminal goes away

  const int interrupt_signal[] = { SIGINT , SIGTERM , SIGHUP } ;

  void on_interrupt ( int )
  {
    if ( interrupt_token )
      interrupt_token->cancel() ;
    for ( int sig : interrupt_signal )
      std::signal ( sig , SIG_DFL ) ;
  }
} ;

void common_arguments::add_common ( ArgParse & ap )
{
  ap.arg("-v", &verbose)
    .help("Verbose output, including the engine command line");

  ap.separator("  encoder options:");

  ap.arg("--profile PROFILE")
    .help("named encoding profile: fast, balanced or quality")
    .metavar("PROFILE");

  ap.arg("--quality CRF")
    .help("constant rate factor, 0-51, lower is better")
    .metavar("CRF");

  ap.arg("--preset NAME")
    .help("encoder speed preset, ultrafast ... veryslow")
    .metavar("NAME");

  ap.separator("  engine options:");

  ap.arg("--ffmpeg PATH")
    .help("engine executable (default: ffmpeg, looked up in PATH)")
    .metavar("PATH");

  ap.arg("--timeout SECONDS")
    .help("terminate an engine run after SECONDS (default: 0, no limit)")
    .metavar("SECONDS");
}

void common_arguments::glean_common ( ArgParse & ap ,
                                      const encoding_profile_t
                                        & default_profile )
{
  set_verbose ( verbose ) ;

  std::string profile_name = ap["profile"].as_string ( "" ) ;
  std::string preset = ap["preset"].as_string ( "" ) ;
  std::string quality = ap["quality"].as_string ( "" ) ;

  try
  {
    profile = profile_name.empty() ? default_profile
                                   : profile_by_name ( profile_name ) ;

    if ( ! quality.empty() && ! OIIO::Strutil::string_is<int> ( quality ) )
      throw usage_error ( "--quality needs an integer, got '"
                          + quality + "'" ) ;

    if ( ! preset.empty() || ! quality.empty() )
    {
      int crf = quality.empty() ? profile.crf
                                : OIIO::Strutil::from_string<int> ( quality ) ;
      profile = make_profile ( preset.empty() ? profile.preset : preset ,
                               crf ) ;
    }
  }
  catch ( const error & e )
  {
    throw usage_error ( e.what() ) ;
  }

  engine = ap["ffmpeg"].as_string ( "ffmpeg" ) ;
  timeout = ap["timeout"].get<float> ( 0.0f ) ;

  if ( timeout < 0.0 )
    throw usage_error ( "--timeout can't be negative" ) ;
}

runner_config_t common_arguments::runner_config() const
{
  runner_config_t config ;
  config.engine = engine ;
  config.timeout = timeout ;
  return config ;
}

void parse_arguments ( ArgParse & ap , int argc , const char ** argv )
{
  // ArgParse uses UTF-8 arguments on all platforms

  OIIO::Filesystem::convert_native_arguments ( argc , argv ) ;

  if ( ap.parse ( argc , argv ) < 0 )
  {
    std::cerr << ap.geterror() << std::endl ;
    ap.print_help() ;
    throw usage_error ( "invalid arguments" ) ;
  }
}

std::vector < std::string > positional ( ArgParse & ap ,
                                         const std::string & name ,
                                         std::size_t least ,
                                         std::size_t most )
{
  auto values = ap[name].as_vec<std::string>() ;

  if ( values.size() < least || values.size() > most )
  {
    ap.print_help() ;
    if ( least == most )
      throw usage_error ( format ( "need {} positional arguments, got {}" ,
                                  least , values.size() ) ) ;
    throw usage_error ( format ( "need {} to {} positional arguments, got {}" ,
                                least , most , values.size() ) ) ;
  }
  return values ;
}

std::string describe ( const encoding_profile_t & profile )
{
  return format ( "{} (preset {}, CRF {})" ,
                  profile.name , profile.preset , profile.crf ) ;
}

void print_banner ( const std::string & title , const banner_t & rows )
{
  std::size_t label_width = 0 ;
  for ( const auto & row : rows )
    label_width = std::max ( label_width , row.first.size() + 1 ) ;

  std::string text = title + "\n" ;
  for ( const auto & row : rows )
  {
    std::string label = row.first + ":" ;
    label.resize ( label_width + 1 , ' ' ) ;
    text += "  " + label + row.second + "\n" ;
  }
  text += std::string ( 60 , '-' ) ;
  log_info ( text ) ;
}

void install_interrupt_handler ( cancel_token_t & token )
{
  interrupt_token = &token ;
  for ( int sig : interrupt_signal )
    std::signal ( sig , on_interrupt ) ;
}

void remove_interrupt_handler()
{
  for ( int sig : interrupt_signal )
    std::signal ( sig , SIG_DFL ) ;
  interrupt_token = nullptr ;
}

} ; // namespace lrvutil
