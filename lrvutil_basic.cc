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

// helper functions for the basic types which aren't performance-
// critical: construction and sanity checks of projection specs and
// encoding profiles.

#include <sstream>

#include "lrvutil_basic.h"

namespace lrvutil
{

projection_spec_t lrv_match_spec ( int input_width ,
                                   int input_height )
{
  projection_spec_t spec ;
  spec.input_width = input_width ;
  spec.input_height = input_height ;
  return spec ;
}

projection_spec_t custom_spec ( int eye_size ,
                                double fov ,
                                int equirect_width )
{
  projection_spec_t spec ;
  spec.output_width = 2 * eye_size ;
  spec.output_height = eye_size ;
  spec.h_fov = spec.v_fov = fov ;
  spec.equirect_width = equirect_width ;
  spec.equirect_height = equirect_width / 2 ;
  validate ( spec ) ;
  return spec ;
}

namespace
{
  void invalid ( const std::string & what )
  {
    throw error ( INVALID_SPEC , what ) ;
  }

  bool fov_ok ( double fov )
  {
    return fov > 0.0 && fov <= 360.0 ;
  }

  bool yaw_ok ( double yaw )
  {
    return yaw >= -180.0 && yaw <= 180.0 ;
  }
} ;

void validate ( const projection_spec_t & spec )
{
  std::ostringstream msg ;

  if ( ! fov_ok ( spec.h_fov ) || ! fov_ok ( spec.v_fov ) )
  {
    msg << "field of view out of range (0,360]: "
        << spec.h_fov << "/" << spec.v_fov ;
    invalid ( msg.str() ) ;
  }

  if ( spec.output_width <= 0 || spec.output_height <= 0 )
  {
    msg << "invalid output size " << spec.output_width
        << "x" << spec.output_height ;
    invalid ( msg.str() ) ;
  }

  // the encoder works in 4:2:0, so each eye needs an even extent

  if ( spec.output_width != 2 * spec.output_height
       || ( spec.output_height & 1 ) )
  {
    msg << "output must be two even-sized square eyes (2:1), got "
        << spec.output_width << "x" << spec.output_height ;
    invalid ( msg.str() ) ;
  }

  if (    spec.equirect_width <= 0
       || spec.equirect_width != 2 * spec.equirect_height )
  {
    msg << "intermediate equirect must be 2:1, got "
        << spec.equirect_width << "x" << spec.equirect_height ;
    invalid ( msg.str() ) ;
  }

  if ( spec.input_width < 0 || spec.input_height < 0 )
  {
    msg << "invalid input size " << spec.input_width
        << "x" << spec.input_height ;
    invalid ( msg.str() ) ;
  }

  if ( ! yaw_ok ( spec.left_yaw ) || ! yaw_ok ( spec.right_yaw ) )
  {
    msg << "yaw out of range [-180,180]: "
        << spec.left_yaw << "/" << spec.right_yaw ;
    invalid ( msg.str() ) ;
  }

  if ( spec.left_yaw != - spec.right_yaw )
  {
    msg << "left and right yaw must mirror each other: "
        << spec.left_yaw << "/" << spec.right_yaw ;
    invalid ( msg.str() ) ;
  }
}

// the speed presets the engine's libx264 encoder accepts, fastest first

const char * const encoder_preset_name[]
{
  "ultrafast" ,
  "superfast" ,
  "veryfast" ,
  "faster" ,
  "fast" ,
  "medium" ,
  "slow" ,
  "slower" ,
  "veryslow"
} ;

const int encoder_preset_count
  = sizeof ( encoder_preset_name ) / sizeof ( const char * ) ;

bool is_encoder_preset ( const std::string & preset )
{
  for ( int i = 0 ; i < encoder_preset_count ; i++ )
  {
    if ( preset == encoder_preset_name [ i ] )
      return true ;
  }
  return false ;
}

encoding_profile_t profile_by_name ( const std::string & name )
{
  if ( name == "fast" )
    return { name , "ultrafast" , 28 } ;
  if ( name == "balanced" )
    return { name , "medium" , 23 } ;
  if ( name == "quality" )
    return { name , "slow" , 18 } ;

  throw error ( INVALID_SPEC ,
                "unknown profile '" + name
                + "' (use fast, balanced or quality)" ) ;
}

encoding_profile_t make_profile ( const std::string & preset , int crf )
{
  encoding_profile_t profile { "custom" , preset , crf } ;
  validate ( profile ) ;
  return profile ;
}

void validate ( const encoding_profile_t & profile )
{
  if ( ! is_encoder_preset ( profile.preset ) )
  {
    throw error ( INVALID_SPEC ,
                  "unknown encoder preset '" + profile.preset + "'" ) ;
  }
  if ( profile.crf < crf_min || profile.crf > crf_max )
  {
    throw error ( INVALID_SPEC ,
                  "CRF " + std::to_string ( profile.crf )
                  + " outside " + std::to_string ( crf_min )
                  + ".." + std::to_string ( crf_max ) ) ;
  }
}

} ; // namespace lrvutil
