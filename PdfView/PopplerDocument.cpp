/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/PopplerDocument.hpp>

/* Vertical gap, in line heights, above which we mark an empty line */
static const qreal paragraphGap = 1.8;

/* Horizontal gap, in line heights, treated as a word space */
static const qreal wordGap = 0.25;

PopplerDocument::PopplerDocument( QString pdfPath ) : QTermDocument( pdfPath ) {
    mPdfDoc = nullptr;
}


PopplerDocument::~PopplerDocument() {
    close();
}


void PopplerDocument::setPassword( QString password ) {
    if ( not mPdfDoc ) {
        return;
    }

    if ( mPdfDoc->unlock( password.toLatin1(), password.toLatin1() ) ) {
        mStatus = Failed;
        mError  = IncorrectPasswordError;

        qDebug() << "Invalid password. Please try again.";
        mPassNeeded = true;
        emit statusChanged( Failed );

        return;
    }

    mPassNeeded = false;
    mStatus     = Loading;
    mError      = NoError;

    emit statusChanged( Loading );

    preparePages();
}


void PopplerDocument::load() {
    mStatus = Loading;
    emit statusChanged( Loading );

    if ( not QFile::exists( mDocPath ) ) {
        mStatus = Failed;
        mError  = FileNotFoundError;
        qWarning() << "No such file:" << mDocPath;
        emit statusChanged( Failed );

        return;
    }

#if QT_VERSION < QT_VERSION_CHECK( 6, 0, 0 )
    mPdfDoc = std::unique_ptr<Poppler::Document>( Poppler::Document::load( mDocPath ) );
#else
    mPdfDoc = Poppler::Document::load( mDocPath );
#endif

    if ( not mPdfDoc ) {
        mStatus = Failed;
        mError  = InvalidFileFormatError;
        qWarning() << "Poppler::Document load failed:" << mDocPath;
        emit statusChanged( Failed );

        return;
    }

    if ( mPdfDoc->isLocked() ) {
        mStatus = Failed;
        mError  = IncorrectPasswordError;
        qWarning() << "Poppler::Document is locked";
        mPassNeeded = true;
        emit statusChanged( Failed );
        return;
    }

    if ( not mPdfDoc->numPages() ) {
        mStatus = Failed;
        mError  = UnknownError;
        qWarning() << "Poppler::Document has no pages";
        mPdfDoc.reset();
        emit statusChanged( Failed );

        return;
    }

    preparePages();
}


void PopplerDocument::preparePages() {
    mPdfDoc->setRenderHint( Poppler::Document::Antialiasing );
    mPdfDoc->setRenderHint( Poppler::Document::TextAntialiasing );
    mPdfDoc->setRenderHint( Poppler::Document::TextHinting );

    for ( int i = 0; i < mPdfDoc->numPages(); i++ ) {
#if QT_VERSION < QT_VERSION_CHECK( 6, 0, 0 )
        Poppler::Page *p = mPdfDoc->page( i );
#else
        Poppler::Page *p = mPdfDoc->page( i ).release();
#endif

        if ( p == nullptr ) {
            qWarning() << "Unable to access page" << i << "of" << mDocPath;
        }

        PdfPage *page = new PdfPage( i, &mDocLock );
        page->setPageData( p );
        mPages.append( page );
    }

    bumpGeneration();

    mStatus = Ready;
    mError  = NoError;

    emit statusChanged( Ready );
    emit pageCountChanged( mPages.count() );
}


void PopplerDocument::close() {
    mStatus = Unloading;
    emit statusChanged( Unloading );

    QMutexLocker locker( &mDocLock );

    qDeleteAll( mPages );
    mPages.clear();

    mPdfDoc.reset();
}


PdfPage::PdfPage( int pgNo, QMutex *lock ) : QTermPage( pgNo ) {
    mDocLock = lock;
}


PdfPage::~PdfPage() {
    m_page.reset();
}


void PdfPage::setPageData( void *data ) {
    m_page = std::unique_ptr<Poppler::Page>( (Poppler::Page *)data );
}


QSizeF PdfPage::pageSize( qreal zoom ) const {
    if ( not m_page ) {
        return QSizeF();
    }

    return m_page->pageSizeF() * zoom;
}


QImage PdfPage::render( QSize pSize, QTermRenderOptions opts ) const {
    if ( not m_page ) {
        return QImage();
    }

    QMutexLocker locker( mDocLock );

    qreal wZoom = 1.0 * pSize.width() / m_page->pageSizeF().width();
    qreal hZoom = 1.0 * pSize.height() / m_page->pageSizeF().height();

    QImage img = m_page->renderToImage( 72 * wZoom, 72 * hZoom, 0, 0, pSize.width(), pSize.height() );

    if ( img.isNull() ) {
        qWarning() << "Poppler could not render page" << mPageNo;
        return img;
    }

    if ( opts.colorMode() == QTermRenderOptions::Grayscale ) {
        img = img.convertToFormat( QImage::Format_Grayscale8 );
    }

    return img.convertToFormat( QImage::Format_RGBA8888 );
}


QTermTextOps PdfPage::textOps() const {
    QTermTextOps ops;

    if ( not m_page ) {
        return ops;
    }

    QMutexLocker locker( mDocLock );

    struct Word {
        QString text;
        QRectF  box;
        bool    spaceAfter;
    };

    QVector<Word> words;

#if QT_VERSION < QT_VERSION_CHECK( 6, 0, 0 )
    QList<Poppler::TextBox *> boxes = m_page->textList();
    for ( Poppler::TextBox *tb: boxes ) {
        words << Word{ tb->text(), tb->boundingBox(), tb->hasSpaceAfter() };
    }
    qDeleteAll( boxes );
#else
    std::vector<std::unique_ptr<Poppler::TextBox> > boxes = m_page->textList();
    for ( const std::unique_ptr<Poppler::TextBox>& tb: boxes ) {
        words << Word{ tb->text(), tb->boundingBox(), tb->hasSpaceAfter() };
    }
#endif

    /** The pen starts at the top-left corner of the page */
    QPointF pen( 0, 0 );
    bool    spaceBefore = false;

    for ( int i = 0; i < words.count(); i++ ) {
        const Word& w          = words.at( i );
        const qreal lineHeight = qMax( w.box.height(), 1.0 );

        QTermTextOp op;
        op.text        = w.text;
        op.translation = QPointF( w.box.left() - pen.x(), w.box.bottom() - pen.y() );

        if ( i > 0 ) {
            /** Moving up the page starts a new block (next column) */
            if ( op.translation.y() < -lineHeight ) {
                op.newline = true;
            }

            /** A large vertical jump: mark the paragraph gap with an empty line */
            else if ( op.translation.y() > paragraphGap * lineHeight ) {
                QTermTextOp gap;
                gap.newline = true;
                ops << gap;
            }

            if ( spaceBefore ) {
                op.spacing = -1000.0;
            }

            else if ( op.translation.x() > wordGap * lineHeight ) {
                op.spacing = -1000.0 * op.translation.x() / lineHeight;
            }
        }

        ops << op;

        pen         = QPointF( w.box.right(), w.box.bottom() );
        spaceBefore = w.spaceAfter;
    }

    return ops;
}
