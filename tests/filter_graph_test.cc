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
#include <map>

#include <gtest/gtest.h>

#include "filter_graph.h"
#include "masking.h"
#include "test_helpers.h"

using namespace lrvutil ;
using lrvutil_test::thrown_kind ;

namespace
{
  // the position of 'value' in argv, or -1

  int index_of ( const std::vector < std::string > & argv ,
                 const std::string & value )
  {
    auto it = std::find ( argv.begin() , argv.end() , value ) ;
    return it == argv.end() ? -1 : int ( it - argv.begin() ) ;
  }

  // the argument following 'flag'

  std::string after ( const std::vector < std::string > & argv ,
                      const std::string & flag )
  {
    int i = index_of ( argv , flag ) ;
    if ( i < 0 || i + 1 >= int ( argv.size() ) )
      return "" ;
    return argv [ i + 1 ] ;
  }

  // every label produced by a stage is consumed by exactly one other
  // stage, except the final label, which goes to the output

  void expect_labels_consumed_once ( const command_spec_t & cmd )
  {
    std::map < std::string , int > consumed ;
    for ( const auto & s : cmd.stages )
      for ( const auto & label : s.inputs )
        ++consumed [ label ] ;

    for ( const auto & s : cmd.stages )
    {
      for ( const auto & label : s.outputs )
      {
        int expected = ( label == cmd.final_label ) ? 0 : 1 ;
        EXPECT_EQ ( consumed [ label ] , expected ) << "label " << label ;
      }
    }
  }
} ;

TEST ( projection_chain , stages_in_order )
{
  auto cmd = build_projection_chain ( "in.360" , lrv_match_spec() ,
                                      profile_by_name ( "balanced" ) ) ;

  ASSERT_EQ ( cmd.stages.size() , 4u ) ;
  EXPECT_EQ ( cmd.stages[0].name , "equirect" ) ;
  EXPECT_EQ ( cmd.stages[1].name , "left_eye" ) ;
  EXPECT_EQ ( cmd.stages[2].name , "right_eye" ) ;
  EXPECT_EQ ( cmd.stages[3].name , "dual_fisheye" ) ;
  EXPECT_EQ ( cmd.final_label , "dual_fisheye" ) ;
  EXPECT_EQ ( cmd.output_width , 1408 ) ;
  EXPECT_EQ ( cmd.output_height , 704 ) ;
  EXPECT_EQ ( cmd.inputs , std::vector < std::string > { "in.360" } ) ;
}

TEST ( projection_chain , filter_parameters )
{
  auto cmd = build_projection_chain ( "in.360" , lrv_match_spec() ,
                                      profile_by_name ( "balanced" ) ) ;

  EXPECT_EQ ( cmd.stage ( "equirect" ) -> str() ,
              "[0:v]v360=eac:e:ih_fov=360:iv_fov=180,scale=3840x1920,"
              "split=2[equirect_left][equirect_right]" ) ;

  EXPECT_EQ ( cmd.stage ( "left_eye" ) -> str() ,
              "[equirect_left]v360=e:fisheye:ih_fov=360:iv_fov=180"
              ":h_fov=190:v_fov=190:w=704:h=704:yaw=-90[left_eye]" ) ;

  EXPECT_EQ ( cmd.stage ( "right_eye" ) -> str() ,
              "[equirect_right]v360=e:fisheye:ih_fov=360:iv_fov=180"
              ":h_fov=190:v_fov=190:w=704:h=704:yaw=90[right_eye]" ) ;

  EXPECT_EQ ( cmd.stage ( "dual_fisheye" ) -> str() ,
              "[left_eye][right_eye]hstack=inputs=2[dual_fisheye]" ) ;

  EXPECT_EQ ( cmd.stage ( "nonexistent" ) , nullptr ) ;

  expect_labels_consumed_once ( cmd ) ;
}

TEST ( projection_chain , custom_geometry )
{
  auto cmd = build_projection_chain ( "in.360" ,
                                      custom_spec ( 512 , 180.0 , 2048 ) ,
                                      profile_by_name ( "fast" ) ) ;

  std::string graph = cmd.filter_complex() ;
  EXPECT_NE ( graph.find ( "scale=2048x1024" ) , std::string::npos ) ;
  EXPECT_NE ( graph.find ( "h_fov=180:v_fov=180:w=512:h=512" ) ,
              std::string::npos ) ;
  EXPECT_EQ ( cmd.output_width , 1024 ) ;
  EXPECT_EQ ( cmd.output_height , 512 ) ;
}

TEST ( projection_chain , rejects_bad_input )
{
  projection_spec_t spec ;
  spec.h_fov = 400.0 ;
  EXPECT_EQ ( thrown_kind ( [&]
                { build_projection_chain ( "in.360" , spec ,
                                           encoding_profile_t() ) ; } ) ,
              INVALID_SPEC ) ;

  encoding_profile_t profile ;
  profile.crf = 60 ;
  EXPECT_EQ ( thrown_kind ( [&]
                { build_projection_chain ( "in.360" , lrv_match_spec() ,
                                           profile ) ; } ) ,
              INVALID_SPEC ) ;
}

TEST ( projection_chain , engine_arguments )
{
  auto cmd = build_projection_chain ( "in.360" , lrv_match_spec() ,
                                      make_profile ( "slow" , 20 ) ) ;
  auto argv = cmd.argv ( "ffmpeg" , "out.mp4" ) ;

  ASSERT_GE ( argv.size() , 4u ) ;
  EXPECT_EQ ( argv[0] , "ffmpeg" ) ;
  EXPECT_EQ ( argv[1] , "-hide_banner" ) ;
  EXPECT_EQ ( argv[2] , "-nostdin" ) ;
  EXPECT_EQ ( argv[3] , "-y" ) ;
  EXPECT_EQ ( argv.back() , "out.mp4" ) ;

  EXPECT_EQ ( after ( argv , "-i" ) , "in.360" ) ;
  EXPECT_EQ ( after ( argv , "-filter_complex" ) , cmd.filter_complex() ) ;
  EXPECT_EQ ( after ( argv , "-map" ) , "[dual_fisheye]" ) ;
  EXPECT_EQ ( after ( argv , "-c:v" ) , "libx264" ) ;
  EXPECT_EQ ( after ( argv , "-crf" ) , "20" ) ;
  EXPECT_EQ ( after ( argv , "-preset" ) , "slow" ) ;
  EXPECT_EQ ( after ( argv , "-c:a" ) , "copy" ) ;
  EXPECT_EQ ( after ( argv , "-movflags" ) , "+faststart" ) ;
  EXPECT_EQ ( index_of ( argv , "-t" ) , -1 ) ;

  // audio is mapped if present, after the video

  int audio = index_of ( argv , "0:a?" ) ;
  ASSERT_GT ( audio , 0 ) ;
  EXPECT_EQ ( argv [ audio - 1 ] , "-map" ) ;
  EXPECT_GT ( audio , index_of ( argv , "[dual_fisheye]" ) ) ;

  // inputs come before the graph, encoder flags after the maps

  EXPECT_LT ( index_of ( argv , "-i" ) , index_of ( argv , "-filter_complex" ) ) ;
  EXPECT_GT ( index_of ( argv , "-c:v" ) , audio ) ;
}

TEST ( masking_chain , stages_and_inputs )
{
  auto mask = generate_mask ( 1408 , 704 ) ;
  auto cmd = build_masking_chain ( "fisheye.mp4" , "/tmp/mask.png" , mask ,
                                   make_profile ( "fast" , 23 ) ) ;

  ASSERT_EQ ( cmd.inputs.size() , 2u ) ;
  EXPECT_EQ ( cmd.inputs[0] , "fisheye.mp4" ) ;
  EXPECT_EQ ( cmd.inputs[1] , "/tmp/mask.png" ) ;

  ASSERT_EQ ( cmd.stages.size() , 4u ) ;
  EXPECT_EQ ( cmd.stage ( "mask" ) -> str() , "[1:v]format=gray[mask]" ) ;
  EXPECT_EQ ( cmd.stage ( "masked" ) -> str() ,
              "[0:v][mask]alphamerge[masked]" ) ;
  EXPECT_EQ ( cmd.stage ( "background" ) -> str() ,
              "color=black:size=1408x704[bg]" ) ;

  std::string final_filter = cmd.stage ( "final" ) -> filter ;
  EXPECT_EQ ( final_filter.find ( "overlay=0:0" ) , 0u ) ;
  EXPECT_NE ( final_filter.find ( "shortest=1" ) , std::string::npos ) ;
  EXPECT_EQ ( final_filter.substr ( final_filter.size() - 14 ) ,
              "format=yuv420p" ) ;

  EXPECT_EQ ( cmd.final_label , "final" ) ;
  EXPECT_EQ ( cmd.output_width , 1408 ) ;
  EXPECT_EQ ( cmd.output_height , 704 ) ;

  expect_labels_consumed_once ( cmd ) ;
}

TEST ( masking_chain , duration_limit )
{
  auto mask = generate_mask ( 1408 , 704 ) ;
  auto cmd = build_masking_chain ( "fisheye.mp4" , "mask.png" , mask ,
                                   make_profile ( "fast" , 23 ) , 30.0 ) ;
  auto argv = cmd.argv ( "ffmpeg" , "out.mp4" ) ;

  EXPECT_EQ ( after ( argv , "-t" ) , "30" ) ;
  EXPECT_GT ( index_of ( argv , "-t" ) , index_of ( argv , "mask.png" ) ) ;
  EXPECT_LT ( index_of ( argv , "-t" ) , index_of ( argv , "-filter_complex" ) ) ;
  EXPECT_EQ ( after ( argv , "-map" ) , "[final]" ) ;

  EXPECT_EQ ( thrown_kind ( [&]
                { build_masking_chain ( "fisheye.mp4" , "mask.png" , mask ,
                                        make_profile ( "fast" , 23 ) ,
                                        -1.0 ) ; } ) ,
              INVALID_SPEC ) ;
}

TEST ( masking_chain , empty_mask )
{
  OIIO::ImageBuf empty ;
  EXPECT_EQ ( thrown_kind ( [&]
                { build_masking_chain ( "fisheye.mp4" , "mask.png" , empty ,
                                        encoding_profile_t() ) ; } ) ,
              INVALID_DIMENSIONS ) ;
}

TEST ( display_command , quotes_special_arguments )
{
  std::vector < std::string > argv
    { "ffmpeg" , "-i" , "my clip.360" , "-map" , "[final]" , "out.mp4" } ;

  EXPECT_EQ ( display_command ( argv ) ,
              "ffmpeg -i 'my clip.360' -map '[final]' out.mp4" ) ;
}
