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

#include <sstream>

#include "filter_graph.h"

namespace lrvutil
{

// numbers in filter options: integral values without a decimal point,
// so 190.0 comes out as '190' and -90.0 as '-90'

static std::string num ( double value )
{
  std::ostringstream osr ;
  osr << value ;
  return osr.str() ;
}

std::string filter_stage_t::str() const
{
  std::string result ;
  for ( const auto & label : inputs )
    result += "[" + label + "]" ;
  result += filter ;
  for ( const auto & label : outputs )
    result += "[" + label + "]" ;
  return result ;
}

std::string command_spec_t::filter_complex() const
{
  std::string result ;
  for ( const auto & s : stages )
  {
    if ( ! result.empty() )
      result += ";" ;
    result += s.str() ;
  }
  return result ;
}

const filter_stage_t * command_spec_t::stage
  ( const std::string & name ) const
{
  for ( const auto & s : stages )
  {
    if ( s.name == name )
      return &s ;
  }
  return nullptr ;
}

std::vector < std::string > command_spec_t::argv
  ( const std::string & engine ,
    const std::string & output ) const
{
  std::vector < std::string > args
    { engine , "-hide_banner" , "-nostdin" , "-y" } ;

  for ( const auto & input : inputs )
  {
    args.push_back ( "-i" ) ;
    args.push_back ( input ) ;
  }

  if ( duration_limit > 0.0 )
  {
    args.push_back ( "-t" ) ;
    args.push_back ( num ( duration_limit ) ) ;
  }

  args.push_back ( "-filter_complex" ) ;
  args.push_back ( filter_complex() ) ;
  args.push_back ( "-map" ) ;
  args.push_back ( "[" + final_label + "]" ) ;

  // all audio streams of the first input, if there are any

  args.push_back ( "-map" ) ;
  args.push_back ( "0:a?" ) ;

  args.insert ( args.end() , encoder_flags.begin() , encoder_flags.end() ) ;

  args.push_back ( "-c:a" ) ;
  args.push_back ( "copy" ) ;
  args.push_back ( "-movflags" ) ;
  args.push_back ( "+faststart" ) ;
  args.push_back ( output ) ;

  return args ;
}

std::vector < std::string > encoder_flags
  ( const encoding_profile_t & profile )
{
  return { "-c:v" , "libx264" ,
           "-crf" , std::to_string ( profile.crf ) ,
           "-preset" , profile.preset } ;
}

command_spec_t build_projection_chain ( const std::string & source ,
                                        const projection_spec_t & spec ,
                                        const encoding_profile_t & profile )
{
  validate ( spec ) ;
  validate ( profile ) ;

  command_spec_t cmd ;
  cmd.inputs.push_back ( source ) ;
  cmd.output_width = spec.output_width ;
  cmd.output_height = spec.output_height ;
  cmd.encoder_flags = encoder_flags ( profile ) ;

  // stage 1: the cubemap to a full 360x180 equirect. A labelled pad can
  // only be consumed once, so the equirect is split, one copy per eye.

  std::ostringstream equirect ;
  equirect << "v360=" << projection_name [ EAC ]
           << ":" << projection_name [ EQUIRECT ]
           << ":ih_fov=360:iv_fov=180"
           << ",scale=" << spec.equirect_width
           << "x" << spec.equirect_height
           << ",split=2" ;

  cmd.stages.push_back ( { "equirect" ,
                           { "0:v" } ,
                           equirect.str() ,
                           { "equirect_left" , "equirect_right" } } ) ;

  // stages 2 and 3: one fisheye per eye, looking to either side

  auto eye = [&] ( double yaw )
  {
    std::ostringstream osr ;
    osr << "v360=" << projection_name [ EQUIRECT ]
        << ":" << projection_name [ FISHEYE ]
        << ":ih_fov=360:iv_fov=180"
        << ":h_fov=" << num ( spec.h_fov )
        << ":v_fov=" << num ( spec.v_fov )
        << ":w=" << spec.eye_width()
        << ":h=" << spec.eye_height()
        << ":yaw=" << num ( yaw ) ;
    return osr.str() ;
  } ;

  cmd.stages.push_back ( { "left_eye" ,
                           { "equirect_left" } ,
                           eye ( spec.left_yaw ) ,
                           { "left_eye" } } ) ;

  cmd.stages.push_back ( { "right_eye" ,
                           { "equirect_right" } ,
                           eye ( spec.right_yaw ) ,
                           { "right_eye" } } ) ;

  // stage 4: side by side

  cmd.stages.push_back ( { "dual_fisheye" ,
                           { "left_eye" , "right_eye" } ,
                           "hstack=inputs=2" ,
                           { "dual_fisheye" } } ) ;

  cmd.final_label = "dual_fisheye" ;
  return cmd ;
}

command_spec_t build_masking_chain ( const std::string & source ,
                                     const std::string & mask_file ,
                                     const OIIO::ImageBuf & mask ,
                                     const encoding_profile_t & profile ,
                                     double duration_limit )
{
  const auto & mspec ( mask.spec() ) ;
  int width = mspec.width ;
  int height = mspec.height ;

  if ( width <= 0 || height <= 0 )
  {
    throw error ( INVALID_DIMENSIONS ,
                  "mask image has no pixels" ) ;
  }

  validate ( profile ) ;

  if ( duration_limit < 0.0 )
  {
    throw error ( INVALID_SPEC ,
                  "negative duration limit " + num ( duration_limit ) ) ;
  }

  command_spec_t cmd ;
  cmd.inputs = { source , mask_file } ;
  cmd.output_width = width ;
  cmd.output_height = height ;
  cmd.duration_limit = duration_limit ;
  cmd.encoder_flags = encoder_flags ( profile ) ;

  std::string size = std::to_string ( width ) + "x" + std::to_string ( height ) ;

  cmd.stages.push_back ( { "mask" ,
                           { "1:v" } ,
                           "format=gray" ,
                           { "mask" } } ) ;

  cmd.stages.push_back ( { "masked" ,
                           { "0:v" , "mask" } ,
                           "alphamerge" ,
                           { "masked" } } ) ;

  cmd.stages.push_back ( { "background" ,
                           { } ,
                           "color=black:size=" + size ,
                           { "bg" } } ) ;

  // the black source never ends, so the overlay has to end with the video

  cmd.stages.push_back ( { "final" ,
                           { "bg" , "masked" } ,
                           "overlay=0:0:format=auto:shortest=1,format=yuv420p" ,
                           { "final" } } ) ;

  cmd.final_label = "final" ;
  return cmd ;
}

std::string display_command ( const std::vector < std::string > & argv )
{
  std::string result ;
  for ( const auto & a : argv )
  {
    if ( ! result.empty() )
      result += " " ;
    if ( a.find_first_of ( " \t;[]'\"?" ) != std::string::npos )
      result += "'" + a + "'" ;
    else
      result += a ;
  }
  return result ;
}

} ; // namespace lrvutil
